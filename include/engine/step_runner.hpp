//! # Step Runner
//!
//! Executes registered rules: expands them into steps, skips steps whose
//! output is up to date, and runs the rest on a pool of worker threads.
//!
//! ## Components
//!
//! | Class        | Description                               |
//! |--------------|-------------------------------------------|
//! | `StepJob`    | One step plus its outcome                 |
//! | `StepQueue`  | Thread-safe work queue                    |
//! | `BuildStats` | Counters reported after a build           |
//! | `StepRunner` | Runs the phases of a RuleRegistry         |
//!
//! ## Phases
//!
//! ```text
//! [target_predeps rules] --all succeeded--> [remaining rules]
//! ```
//!
//! Steps inside a phase are independent and run in any order. A failing
//! step never stops its siblings, but a failing phase stops the next one.

#ifndef TSBUILD_ENGINE_STEP_RUNNER_HPP
#define TSBUILD_ENGINE_STEP_RUNNER_HPP

#include "rules/rule_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace tsbuild::engine {

enum class StepState {
    Pending,
    UpToDate, // Output newer than input, nothing run
    Compiled,
    Failed,
    Planned // Dry run: would have been compiled
};

const char* step_state_name(StepState state);

/**
 * A step scheduled for execution
 */
struct StepJob {
    rules::BuildStep step;
    StepState state = StepState::Pending;
    int exit_code = 0;
    std::string error_message;
};

/**
 * Build statistics for reporting
 */
struct BuildStats {
    std::atomic<int> total{0};
    std::atomic<int> compiled{0};
    std::atomic<int> up_to_date{0};
    std::atomic<int> failed{0};
    std::atomic<int> planned{0};
    std::chrono::steady_clock::time_point start_time;

    void reset() {
        total = 0;
        compiled = 0;
        up_to_date = 0;
        failed = 0;
        planned = 0;
        start_time = std::chrono::steady_clock::now();
    }

    int64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

/**
 * Thread-safe work queue. Workers block in pop() until a job arrives or the
 * queue is closed and drained.
 */
class StepQueue {
public:
    void push(std::shared_ptr<StepJob> job);

    /// Returns nullptr once the queue is closed and empty.
    std::shared_ptr<StepJob> pop();

    /// No more pushes; wakes every waiting worker.
    void close();

    size_t size();

private:
    std::queue<std::shared_ptr<StepJob>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

struct StepRunnerOptions {
    int jobs = 0;         // Worker threads, 0 = hardware concurrency
    bool force = false;   // Ignore timestamps
    bool dry_run = false; // Print commands instead of running them
    bool quiet = false;   // No per-step progress lines
};

/**
 * Runs the steps of registered rules.
 */
class StepRunner {
public:
    explicit StepRunner(StepRunnerOptions options = {});

    /// Run every phase of `registry`. True if no step failed.
    bool run(const rules::RuleRegistry& registry);

    /// Run a single phase made of `steps`. True if no step failed.
    bool run_steps(std::vector<rules::BuildStep> steps);

    const BuildStats& stats() const {
        return stats_;
    }

    /// Every job run so far, in submission order.
    const std::vector<std::shared_ptr<StepJob>>& jobs() const {
        return jobs_;
    }

    /// Number of worker threads a phase of `step_count` steps would use.
    int thread_count(size_t step_count) const;

private:
    StepRunnerOptions options_;
    BuildStats stats_;
    std::vector<std::shared_ptr<StepJob>> jobs_;
    std::atomic<int> started_{0};
    std::mutex output_mutex_;

    void worker_thread(StepQueue& queue);
    void execute(StepJob& job);
    void fail(StepJob& job, std::string message);
};

/// True when `output` exists and is at least as new as `input`.
bool is_up_to_date(const fs::path& input, const fs::path& output);

/// Run `command` through the system shell and return its exit code
/// (-1 if the shell could not be started).
int run_shell_command(const std::string& command);

struct CleanResult {
    int removed = 0;
    int failed = 0;
};

/// Delete the outputs of every rule not flagged no_clean.
CleanResult clean_outputs(const rules::RuleRegistry& registry, bool dry_run = false);

} // namespace tsbuild::engine

#endif // TSBUILD_ENGINE_STEP_RUNNER_HPP
