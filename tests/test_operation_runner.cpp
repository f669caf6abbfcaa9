#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "../include/OperationRunner.hpp"
#include "FakeExecutor.hpp"

using namespace devops;
using devops::fakes::FakeExecutor;

namespace
{
    struct Harness
    {
        FakeExecutor exec;
        std::ostringstream out;
        std::ostringstream err;
        std::ostringstream log_sink;
        Logger log{log_sink, LogLevel::info};
        OperationRunner runner{exec, EnvList{"PATH=/usr/bin"}, log, out, err};
    };

    Operation steps(std::vector<std::string> s, const bool fail_fast = false)
    {
        Operation op;
        op.steps = std::move(s);
        op.fail_fast = fail_fast;
        return op;
    }
} // namespace

TEST(OperationRunner, EmptyStepsDoNotTouchTheExecutor)
{
    Harness h;
    Operation op;
    op.env = {{"IGNORED", "1"}};
    EXPECT_NO_THROW(h.runner.run(Context::background(), op));
    EXPECT_TRUE(h.exec.executed.empty());
    EXPECT_TRUE(h.exec.env_calls.empty());
    EXPECT_EQ(h.out.str(), "");
}

TEST(OperationRunner, RunsStepsInOrder)
{
    Harness h;
    h.runner.run(Context::background(), steps({"echo one", "echo two", "echo three"}));
    const std::vector<std::string> expected = {"echo one", "echo two", "echo three"};
    EXPECT_EQ(h.exec.executed, expected);
    const auto text = h.out.str();
    EXPECT_NE(text.find("[1] echo one\n"), std::string::npos);
    EXPECT_NE(text.find("[3] echo three\n"), std::string::npos);
    EXPECT_LT(text.find("[1] echo one"), text.find("[2] echo two"));
}

TEST(OperationRunner, FailFastStopsAtFirstFailure)
{
    Harness h;
    h.exec.on("exit 2", 2);
    try {
        h.runner.run(Context::background(), steps({"echo a", "exit 2", "echo b"}, true));
        FAIL() << "expected OperationError";
    } catch (const OperationError &e) {
        EXPECT_NE(std::string(e.what()).find("exit 2"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("exit code 2"), std::string::npos);
        EXPECT_EQ(e.failed_steps(), std::vector<std::string>{"exit 2"});
    }
    const std::vector<std::string> expected = {"echo a", "exit 2"};
    EXPECT_EQ(h.exec.executed, expected);
}

TEST(OperationRunner, CollectAllRunsEveryStepAndNamesOnlyFailures)
{
    Harness h;
    h.exec.on("false", 1);
    try {
        h.runner.run(Context::background(), steps({"true", "false", "true"}));
        FAIL() << "expected OperationError";
    } catch (const OperationError &e) {
        EXPECT_STREQ(e.what(), "failed to run steps: [false]");
        EXPECT_EQ(e.failed_steps(), std::vector<std::string>{"false"});
    }
    EXPECT_EQ(h.exec.executed.size(), 3u);
}

TEST(OperationRunner, CollectAllKeepsEveryFailureInOrder)
{
    Harness h;
    h.exec.on("exit 3", 3).on("exit 4", 4);
    try {
        h.runner.run(Context::background(), steps({"exit 3", "true", "exit 4"}));
        FAIL() << "expected OperationError";
    } catch (const OperationError &e) {
        EXPECT_STREQ(e.what(), "failed to run steps: [exit 3, exit 4]");
        EXPECT_EQ(e.failed_steps().size(), 2u);
    }
}

TEST(OperationRunner, LaunchFailureCountsAsFailedStep)
{
    Harness h;
    h.exec.fail_launch("broken", "no such file");
    try {
        h.runner.run(Context::background(), steps({"broken", "echo after"}));
        FAIL() << "expected OperationError";
    } catch (const OperationError &e) {
        EXPECT_EQ(e.failed_steps(), std::vector<std::string>{"broken"});
    }
    EXPECT_EQ(h.exec.executed.size(), 2u);
}

TEST(OperationRunner, EnvironmentInstalledOnceBeforeSteps)
{
    Harness h;
    Operation op = steps({"echo $FOO", "echo $BAR"});
    op.env = {{"FOO", "foo"}, {"BAR", "bar"}};
    h.runner.run(Context::background(), op);
    ASSERT_EQ(h.exec.env_calls.size(), 1u);
    const EnvList expected = {"PATH=/usr/bin", "BAR=bar", "FOO=foo"};
    EXPECT_EQ(h.exec.env_calls.front(), expected);
    EXPECT_NE(h.log_sink.str().find("Loading 2 additional environment variable(s): [BAR, FOO]"),
              std::string::npos);
}

TEST(OperationRunner, AmbientEnvironmentInstalledWithoutOverrides)
{
    Harness h;
    h.runner.run(Context::background(), steps({"true"}));
    ASSERT_EQ(h.exec.env_calls.size(), 1u);
    EXPECT_EQ(h.exec.env_calls.front(), EnvList{"PATH=/usr/bin"});
}

TEST(OperationRunner, ForwardsStepOutput)
{
    Harness h;
    h.exec.on("talk", 0, "to stdout", "to stderr\n");
    h.runner.run(Context::background(), steps({"talk"}));
    EXPECT_NE(h.out.str().find("to stdout\n"), std::string::npos);
    EXPECT_EQ(h.err.str(), "to stderr\n");
}

TEST(OperationRunner, ForwardsOutputOfTheFailingStep)
{
    Harness h;
    h.exec.on("explode", 1, "partial", "boom");
    EXPECT_THROW(h.runner.run(Context::background(), steps({"explode"}, true)), OperationError);
    EXPECT_NE(h.out.str().find("partial\n"), std::string::npos);
    EXPECT_EQ(h.err.str(), "boom\n");
}

TEST(OperationRunner, PrintsSeparatorAfterSteps)
{
    Harness h;
    h.runner.run(Context::background(), steps({"true"}));
    EXPECT_NE(h.out.str().find("========"), std::string::npos);

    Harness failing;
    failing.exec.on("false", 1);
    EXPECT_THROW(failing.runner.run(Context::background(), steps({"false"}, true)), OperationError);
    EXPECT_NE(failing.out.str().find("========"), std::string::npos);
}

TEST(OperationRunner, ReportsStepStatusAtInfoLevel)
{
    Harness h;
    h.exec.on("false", 1);
    EXPECT_THROW(h.runner.run(Context::background(), steps({"true", "false"})), OperationError);
    const auto log = h.log_sink.str();
    EXPECT_NE(log.find("[ ok ]"), std::string::npos);
    EXPECT_NE(log.find("[ !! ]"), std::string::npos);
}

TEST(OperationRunner, CancellationAbortsEvenWithoutFailFast)
{
    Harness h;
    const auto ctx = Context::with_cancel(Context::background());
    ctx.cancel();
    try {
        h.runner.run(ctx, steps({"echo a", "echo b"}));
        FAIL() << "expected OperationError";
    } catch (const OperationError &e) {
        EXPECT_NE(std::string(e.what()).find("exit code -1"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("context canceled"), std::string::npos);
    }
    EXPECT_EQ(h.exec.executed, std::vector<std::string>{"echo a"});
}

TEST(OperationRunner, StageWithoutStepsOnlyWarns)
{
    std::ostringstream sink;
    const Logger quiet(sink, LogLevel::warn);
    FakeExecutor exec;
    std::ostringstream out;
    const OperationRunner runner(exec, {}, quiet, out, out);
    EXPECT_NO_THROW(runner.run_stage(Context::background(), "build", Operation{}));
    EXPECT_NE(sink.str().find("No build steps defined in the configuration."), std::string::npos);
    EXPECT_TRUE(exec.executed.empty());
}

TEST(OperationRunner, StageFailureIsPrefixed)
{
    Harness h;
    h.exec.on("false", 1);
    try {
        h.runner.run_stage(Context::background(), "test", steps({"false"}));
        FAIL() << "expected OperationError";
    } catch (const OperationError &e) {
        EXPECT_STREQ(e.what(), "failed to run test steps: failed to run steps: [false]");
        EXPECT_EQ(e.failed_steps(), std::vector<std::string>{"false"});
    }
}

TEST(OperationRunner, StageSuccessLogsDuration)
{
    Harness h;
    h.runner.run_stage(Context::background(), "install", steps({"true"}));
    EXPECT_NE(h.log_sink.str().find("install completed successfully (duration "), std::string::npos);
}
