//! # Step Runner Tests
//!
//! Staleness checks, parallel execution, failure isolation, dry runs,
//! phases and cleaning. Rules use `cp` as their tool so no Qt installation
//! is needed.

#include "engine/step_runner.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <thread>

using namespace tsbuild;
using namespace tsbuild::engine;
using namespace tsbuild::rules;
namespace fs = std::filesystem;

// ============================================================================
// StepQueue
// ============================================================================

TEST(StepQueueTest, PopInFifoOrder) {
    StepQueue queue;
    auto a = std::make_shared<StepJob>();
    auto b = std::make_shared<StepJob>();
    queue.push(a);
    queue.push(b);
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.pop(), a);
    EXPECT_EQ(queue.pop(), b);
}

TEST(StepQueueTest, ClosedEmptyQueueReturnsNull) {
    StepQueue queue;
    queue.push(std::make_shared<StepJob>());
    queue.close();

    EXPECT_NE(queue.pop(), nullptr);
    EXPECT_EQ(queue.pop(), nullptr);
}

TEST(StepQueueTest, CloseWakesWaitingWorker) {
    StepQueue queue;
    std::shared_ptr<StepJob> popped = std::make_shared<StepJob>();

    std::thread worker([&] { popped = queue.pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    worker.join();

    EXPECT_EQ(popped, nullptr);
}

// ============================================================================
// Fixture
// ============================================================================

class StepRunnerTest : public ::testing::Test {
protected:
    fs::path root;
    fs::path src;
    fs::path out;
    std::vector<fs::path> inputs;

    void SetUp() override {
        root = fs::temp_directory_path() / "tsbuild_step_runner_test";
        fs::remove_all(root);
        src = root / "translations";
        out = root / "bin" / "translations";
        fs::create_directories(src);

        for (const char* locale : {"cs", "de", "ru", "uk"}) {
            fs::path path = src / ("svgcleaner_" + std::string(locale) + ".ts");
            write_file(path, std::string("<TS language=\"") + locale + "\"/>\n");
            inputs.push_back(path);
        }
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    static void write_file(const fs::path& path, const std::string& content) {
        std::ofstream(path) << content;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    BuildRule copy_rule(const std::string& command = "cp {in} {out}") const {
        BuildRule rule;
        rule.name = TRANSLATION_RULE_NAME;
        rule.inputs = inputs;
        rule.output_dir = out;
        rule.command_template = command;
        rule.flags.no_link = true;
        rule.flags.target_predeps = true;
        return rule;
    }

    static StepRunnerOptions quiet_options() {
        StepRunnerOptions options;
        options.quiet = true;
        options.jobs = 2;
        return options;
    }

    RuleRegistry registry_with(BuildRule rule) {
        RuleRegistry registry;
        auto error = registry.add(std::move(rule));
        EXPECT_FALSE(error.has_value()) << error.value_or("");
        return registry;
    }

    static const StepJob* job_for(const StepRunner& runner, const fs::path& input) {
        for (const auto& job : runner.jobs()) {
            if (job->step.input == input)
                return job.get();
        }
        return nullptr;
    }
};

// ============================================================================
// Building
// ============================================================================

TEST_F(StepRunnerTest, CompilesEveryInputAndCreatesOutputDir) {
    auto registry = registry_with(copy_rule());
    StepRunner runner(quiet_options());

    EXPECT_TRUE(runner.run(registry));

    EXPECT_EQ(runner.stats().total.load(), 4);
    EXPECT_EQ(runner.stats().compiled.load(), 4);
    EXPECT_EQ(runner.stats().failed.load(), 0);
    for (const char* name :
         {"svgcleaner_cs.qm", "svgcleaner_de.qm", "svgcleaner_ru.qm", "svgcleaner_uk.qm"}) {
        EXPECT_TRUE(fs::exists(out / name)) << name;
    }
    EXPECT_EQ(read_file(out / "svgcleaner_de.qm"), "<TS language=\"de\"/>\n");
}

TEST_F(StepRunnerTest, DeletedInputFailsOnlyItsStep) {
    fs::remove(inputs[2]);
    auto registry = registry_with(copy_rule());
    StepRunner runner(quiet_options());

    EXPECT_FALSE(runner.run(registry));

    EXPECT_EQ(runner.stats().failed.load(), 1);
    EXPECT_EQ(runner.stats().compiled.load(), 3);

    const StepJob* failed = job_for(runner, inputs[2]);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->state, StepState::Failed);
    EXPECT_EQ(failed->error_message, "input not found");
    EXPECT_FALSE(fs::exists(out / "svgcleaner_ru.qm"));

    for (size_t i : {0u, 1u, 3u}) {
        const StepJob* job = job_for(runner, inputs[i]);
        ASSERT_NE(job, nullptr);
        EXPECT_EQ(job->state, StepState::Compiled);
    }
}

TEST_F(StepRunnerTest, UpToDateStepsAreSkipped) {
    auto registry = registry_with(copy_rule());
    {
        StepRunner first(quiet_options());
        ASSERT_TRUE(first.run(registry));
    }

    StepRunner second(quiet_options());
    EXPECT_TRUE(second.run(registry));
    EXPECT_EQ(second.stats().up_to_date.load(), 4);
    EXPECT_EQ(second.stats().compiled.load(), 0);
}

TEST_F(StepRunnerTest, NewerInputIsRebuilt) {
    auto registry = registry_with(copy_rule());
    {
        StepRunner first(quiet_options());
        ASSERT_TRUE(first.run(registry));
    }

    auto output_time = fs::last_write_time(out / "svgcleaner_cs.qm");
    fs::last_write_time(inputs[0], output_time + std::chrono::hours(1));

    StepRunner second(quiet_options());
    EXPECT_TRUE(second.run(registry));
    EXPECT_EQ(second.stats().compiled.load(), 1);
    EXPECT_EQ(second.stats().up_to_date.load(), 3);
    EXPECT_EQ(job_for(second, inputs[0])->state, StepState::Compiled);
}

TEST_F(StepRunnerTest, ForceRebuildsEverything) {
    auto registry = registry_with(copy_rule());
    {
        StepRunner first(quiet_options());
        ASSERT_TRUE(first.run(registry));
    }

    auto options = quiet_options();
    options.force = true;
    StepRunner forced(options);
    EXPECT_TRUE(forced.run(registry));
    EXPECT_EQ(forced.stats().compiled.load(), 4);
    EXPECT_EQ(forced.stats().up_to_date.load(), 0);
}

TEST_F(StepRunnerTest, DryRunWritesNothing) {
    auto registry = registry_with(copy_rule());
    auto options = quiet_options();
    options.dry_run = true;
    StepRunner runner(options);

    EXPECT_TRUE(runner.run(registry));
    EXPECT_EQ(runner.stats().planned.load(), 4);
    EXPECT_EQ(runner.stats().compiled.load(), 0);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(StepRunnerTest, FailingCommandReportsExitCode) {
    auto registry = registry_with(copy_rule("sh -c 'exit 3'"));
    StepRunner runner(quiet_options());

    EXPECT_FALSE(runner.run(registry));
    EXPECT_EQ(runner.stats().failed.load(), 4);
    const StepJob* job = job_for(runner, inputs[0]);
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->exit_code, 3);
    EXPECT_EQ(job->error_message, "command failed with exit code 3");
}

TEST_F(StepRunnerTest, MissingToolFailsEveryStep) {
    auto rule = copy_rule(default_command_template(true));
    rule.tool = (root / "no-such-lrelease").string();
    auto registry = registry_with(rule);
    StepRunner runner(quiet_options());

    EXPECT_FALSE(runner.run(registry));
    EXPECT_EQ(runner.stats().failed.load(), 4);
}

TEST_F(StepRunnerTest, CommandWithoutOutputFails) {
    auto registry = registry_with(copy_rule("true"));
    StepRunner runner(quiet_options());

    EXPECT_FALSE(runner.run(registry));
    EXPECT_EQ(runner.stats().failed.load(), 4);
    EXPECT_NE(job_for(runner, inputs[1])->error_message.find("did not produce"),
              std::string::npos);
}

TEST_F(StepRunnerTest, FailedPredepsPhaseStopsLaterRules) {
    fs::remove(inputs[0]);

    RuleRegistry registry;
    ASSERT_FALSE(registry.add(copy_rule()).has_value());

    BuildRule later;
    later.name = "package";
    later.inputs = {inputs[1]};
    later.output_dir = root / "pkg";
    later.extension = ".bin";
    later.command_template = "cp {in} {out}";
    ASSERT_FALSE(registry.add(later).has_value());

    StepRunner runner(quiet_options());
    EXPECT_FALSE(runner.run(registry));

    EXPECT_EQ(runner.jobs().size(), 4u);
    EXPECT_FALSE(fs::exists(root / "pkg"));
}

TEST_F(StepRunnerTest, LaterPhaseRunsAfterPredeps) {
    RuleRegistry registry;
    ASSERT_FALSE(registry.add(copy_rule()).has_value());

    // Consumes an output of the predeps phase
    BuildRule later;
    later.name = "package";
    later.inputs = {out / "svgcleaner_de.qm"};
    later.output_dir = root / "pkg";
    later.extension = ".bin";
    later.command_template = "cp {in} {out}";
    ASSERT_FALSE(registry.add(later).has_value());

    StepRunner runner(quiet_options());
    EXPECT_TRUE(runner.run(registry));
    EXPECT_EQ(runner.stats().compiled.load(), 5);
    EXPECT_TRUE(fs::exists(root / "pkg" / "svgcleaner_de.bin"));
}

TEST_F(StepRunnerTest, ThreadCount) {
    StepRunnerOptions options;
    options.jobs = 8;
    StepRunner runner(options);
    EXPECT_EQ(runner.thread_count(4), 4);
    EXPECT_EQ(runner.thread_count(20), 8);
    EXPECT_EQ(runner.thread_count(0), 1);

    StepRunner automatic;
    EXPECT_GE(automatic.thread_count(100), 1);
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(StepRunnerTest, IsUpToDate) {
    fs::path output = root / "out.qm";
    EXPECT_FALSE(is_up_to_date(inputs[0], output));

    write_file(output, "qm");
    fs::last_write_time(output, fs::last_write_time(inputs[0]) + std::chrono::seconds(5));
    EXPECT_TRUE(is_up_to_date(inputs[0], output));

    fs::last_write_time(inputs[0], fs::last_write_time(output) + std::chrono::seconds(5));
    EXPECT_FALSE(is_up_to_date(inputs[0], output));
}

TEST(RunShellCommandTest, ReturnsExitStatus) {
    EXPECT_EQ(run_shell_command("true"), 0);
    EXPECT_EQ(run_shell_command("exit 7"), 7);
}

TEST_F(StepRunnerTest, CleanRemovesOutputs) {
    auto registry = registry_with(copy_rule());
    {
        StepRunner runner(quiet_options());
        ASSERT_TRUE(runner.run(registry));
    }

    auto dry = clean_outputs(registry, true);
    EXPECT_EQ(dry.removed, 4);
    EXPECT_TRUE(fs::exists(out / "svgcleaner_cs.qm"));

    auto result = clean_outputs(registry);
    EXPECT_EQ(result.removed, 4);
    EXPECT_EQ(result.failed, 0);
    EXPECT_FALSE(fs::exists(out / "svgcleaner_cs.qm"));
    EXPECT_TRUE(fs::exists(inputs[0]));

    EXPECT_EQ(clean_outputs(registry).removed, 0);
}

TEST(StepStateTest, Names) {
    EXPECT_STREQ(step_state_name(StepState::UpToDate), "up to date");
    EXPECT_STREQ(step_state_name(StepState::Planned), "planned");
}
