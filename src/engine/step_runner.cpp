//! # Step Runner
//!
//! Runs build steps on worker threads.
//!
//! ## Step Lifecycle
//!
//! ```text
//! Pending ─┬─ input missing ─────────────→ Failed
//!          ├─ output up to date ─────────→ UpToDate
//!          ├─ dry run ───────────────────→ Planned
//!          └─ run command ─┬─ exit 0 + output exists → Compiled
//!                          └─ otherwise ─────────────→ Failed
//! ```
//!
//! ## Thread Safety
//!
//! | Component  | Synchronization                   |
//! |------------|-----------------------------------|
//! | StepQueue  | Mutex + condition variable        |
//! | BuildStats | Atomic counters                   |
//! | StepJob    | Owned by one worker while running |
//! | stdout     | output_mutex_                     |

#include "engine/step_runner.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <iterator>
#include <system_error>
#include <thread>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace tsbuild::engine {

const char* step_state_name(StepState state) {
    switch (state) {
    case StepState::Pending:
        return "pending";
    case StepState::UpToDate:
        return "up to date";
    case StepState::Compiled:
        return "compiled";
    case StepState::Failed:
        return "failed";
    case StepState::Planned:
        return "planned";
    }
    return "unknown";
}

// ============================================================================
// Helpers
// ============================================================================

bool is_up_to_date(const fs::path& input, const fs::path& output) {
    std::error_code ec;
    auto out_time = fs::last_write_time(output, ec);
    if (ec)
        return false;
    auto in_time = fs::last_write_time(input, ec);
    if (ec)
        return false;
    return out_time >= in_time;
}

int run_shell_command(const std::string& command) {
    std::cout.flush();
    int ret = std::system(command.c_str());
    if (ret == -1)
        return -1;
#ifdef _WIN32
    return ret;
#else
    if (WIFEXITED(ret))
        return WEXITSTATUS(ret);
    // Killed by a signal
    return 128 + (WIFSIGNALED(ret) ? WTERMSIG(ret) : 0);
#endif
}

CleanResult clean_outputs(const rules::RuleRegistry& registry, bool dry_run) {
    CleanResult result;

    for (const auto& output : registry.clean_outputs()) {
        std::error_code ec;
        if (!fs::exists(output, ec))
            continue;

        if (dry_run) {
            std::cout << "rm " << output.string() << "\n";
            result.removed++;
            continue;
        }

        if (fs::remove(output, ec)) {
            TSBUILD_LOG_INFO("engine", "Removed " << output.string());
            result.removed++;
        } else {
            TSBUILD_LOG_ERROR("engine", "Cannot remove " << output.string() << ": "
                                                         << ec.message());
            result.failed++;
        }
    }

    return result;
}

// ============================================================================
// StepQueue
// ============================================================================

void StepQueue::push(std::shared_ptr<StepJob> job) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(job));
    cv_.notify_one();
}

std::shared_ptr<StepJob> StepQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty())
        return nullptr;

    auto job = queue_.front();
    queue_.pop();
    return job;
}

void StepQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

size_t StepQueue::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// StepRunner
// ============================================================================

StepRunner::StepRunner(StepRunnerOptions options) : options_(options) {
    stats_.reset();
}

int StepRunner::thread_count(size_t step_count) const {
    int wanted = options_.jobs;
    if (wanted <= 0) {
        wanted = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
    return std::max(1, std::min(wanted, static_cast<int>(step_count)));
}

bool StepRunner::run(const rules::RuleRegistry& registry) {
    stats_.reset();

    for (const auto& phase : registry.phases()) {
        std::vector<rules::BuildStep> steps;
        for (const rules::BuildRule* rule : phase) {
            auto rule_steps = rules::expand_rule(*rule);
            steps.insert(steps.end(), std::make_move_iterator(rule_steps.begin()),
                         std::make_move_iterator(rule_steps.end()));
        }

        if (!run_steps(std::move(steps))) {
            TSBUILD_LOG_DEBUG("engine", "Phase failed, later phases skipped");
            return false;
        }
    }

    return true;
}

bool StepRunner::run_steps(std::vector<rules::BuildStep> steps) {
    if (steps.empty())
        return true;

    int failed_before = stats_.failed;
    stats_.total += static_cast<int>(steps.size());

    StepQueue queue;
    for (auto& step : steps) {
        auto job = std::make_shared<StepJob>();
        job->step = std::move(step);
        jobs_.push_back(job);
        queue.push(std::move(job));
    }
    queue.close();

    int threads = thread_count(steps.size());
    TSBUILD_LOG_DEBUG("engine", "Running " << steps.size() << " step(s) on " << threads
                                           << " thread(s)");

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back(&StepRunner::worker_thread, this, std::ref(queue));
    }
    for (auto& worker : workers) {
        worker.join();
    }

    return stats_.failed == failed_before;
}

void StepRunner::worker_thread(StepQueue& queue) {
    while (auto job = queue.pop()) {
        execute(*job);
    }
}

void StepRunner::fail(StepJob& job, std::string message) {
    TSBUILD_LOG_DEBUG("engine", "Step failed: " << job.step.input.string() << ": " << message);
    job.state = StepState::Failed;
    job.error_message = std::move(message);
    stats_.failed++;
}

void StepRunner::execute(StepJob& job) {
    const rules::BuildStep& step = job.step;
    std::error_code ec;

    if (!fs::exists(step.input, ec)) {
        fail(job, "input not found");
        return;
    }

    if (!options_.force && is_up_to_date(step.input, step.output)) {
        TSBUILD_LOG_INFO("engine", step.output.string() << " is up to date");
        job.state = StepState::UpToDate;
        stats_.up_to_date++;
        return;
    }

    if (options_.dry_run) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout << step.command << "\n";
        job.state = StepState::Planned;
        stats_.planned++;
        return;
    }

    if (step.output.has_parent_path()) {
        fs::create_directories(step.output.parent_path(), ec);
        if (ec) {
            fail(job, "cannot create '" + step.output.parent_path().string() +
                          "': " + ec.message());
            return;
        }
    }

    if (!options_.quiet) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout << "[" << ++started_ << "/" << stats_.total.load() << "] Compiling "
                  << step.input.string() << " -> " << step.output.string() << "\n";
    }
    TSBUILD_LOG_DEBUG("engine", "$ " << step.command);

    int ret = run_shell_command(step.command);
    job.exit_code = ret;

    if (ret != 0) {
        fail(job, "command failed with exit code " + std::to_string(ret));
        return;
    }
    if (!fs::exists(step.output, ec)) {
        fail(job, "command did not produce '" + step.output.string() + "'");
        return;
    }

    job.state = StepState::Compiled;
    stats_.compiled++;
}

} // namespace tsbuild::engine
