#include "brew_error.hpp"
#include "process_runner.hpp"
#include <gtest/gtest.h>
#include <cerrno>
#include <csignal>
#include <chrono>
#include <thread>

namespace {

LocalProcessRunner make_runner() {
    return LocalProcessRunner(RunnerOptions{{}, {}});
}

CommandSpec shell(const std::string& script) {
    return build_command("/bin/sh", {"-c", script});
}

} // namespace

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    LocalProcessRunner runner = make_runner();

    ExecutionResult result = runner.execute(shell("echo out; echo err >&2; exit 3"));

    EXPECT_EQ(result.std_out, "out\n");
    EXPECT_EQ(result.std_err, "err\n");
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.trimmed_output(), "out");
}

TEST(ProcessRunnerTest, MissingExecutableIsLaunchFailure) {
    LocalProcessRunner runner = make_runner();

    try {
        runner.execute(build_command("/nonexistent/brewline-test-binary", {}));
        FAIL() << "expected LaunchFailure";
    } catch (const LaunchFailure& e) {
        EXPECT_EQ(e.error_number(), ENOENT);
        EXPECT_EQ(e.executable(), "/nonexistent/brewline-test-binary");
    }

    EXPECT_THROW(runner.execute(build_command("brewline-no-such-tool-on-path", {})), LaunchFailure);
    EXPECT_THROW(runner.stream(build_command("/nonexistent/brewline-test-binary", {})), LaunchFailure);
}

TEST(ProcessRunnerTest, NonZeroExitIsNotLaunchFailure) {
    LocalProcessRunner runner = make_runner();
    ExecutionResult result;
    EXPECT_NO_THROW(result = runner.execute(shell("exit 1")));
    EXPECT_EQ(result.exit_code, 1);
}

TEST(ProcessRunnerTest, LargeOutputOnBothPipesDoesNotDeadlock) {
    LocalProcessRunner runner = make_runner();

    // Well past the 64 KiB pipe buffer on each stream.
    ExecutionResult result = runner.execute(shell(
        "i=0; while [ $i -lt 20000 ]; do echo 'stdout line of some length'; "
        "echo 'stderr line of some length' >&2; i=$((i+1)); done"));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.std_out.size(), 20000u * 27u);
    EXPECT_EQ(result.std_err.size(), 20000u * 27u);
}

TEST(ProcessRunnerTest, EnvironmentOverridesReachTheChild) {
    LocalProcessRunner runner(RunnerOptions{{}, {{"BREWLINE_PROXY_VAR", "from-proxy"}}});

    ExecutionResult result = runner.execute(build_command(
        "/bin/sh", {"-c", "echo \"$BREWLINE_PROXY_VAR $BREWLINE_TEST_VAR\""}, {{"BREWLINE_TEST_VAR", "set"}}));

    EXPECT_EQ(result.trimmed_output(), "from-proxy set");
}

TEST(ProcessRunnerTest, StdinIsEmpty) {
    LocalProcessRunner runner = make_runner();
    ExecutionResult result = runner.execute(shell("cat; echo done"));
    EXPECT_EQ(result.std_out, "done\n");
}

TEST(OutputStreamTest, ChunksArriveInOrder) {
    LocalProcessRunner runner = make_runner();

    auto stream = runner.stream(shell("for i in 1 2 3 4 5; do echo line$i; done; echo oops >&2"));
    std::string text = collect(*stream);

    EXPECT_EQ(text, "line1\nline2\nline3\nline4\nline5\noops\n");
    EXPECT_EQ(stream->exit_code(), 0);
}

TEST(OutputStreamTest, EndsOnFailureWithExitCode) {
    LocalProcessRunner runner = make_runner();

    auto stream = runner.stream(shell("echo partial; exit 4"));
    EXPECT_EQ(collect(*stream), "partial\n");
    EXPECT_EQ(stream->exit_code(), 4);
    EXPECT_FALSE(stream->next().has_value());
}

TEST(OutputStreamTest, FirstChunkBeforeProcessEnds) {
    LocalProcessRunner runner = make_runner();

    auto start = std::chrono::steady_clock::now();
    auto stream = runner.stream(shell("echo first; sleep 2; echo second"));
    auto first = stream->next();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->substr(0, 5), "first");
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    stream->terminate();
}

TEST(OutputStreamTest, EndsWhenProcessExitsEvenIfPipeIsHeld) {
    LocalProcessRunner runner = make_runner();

    auto start = std::chrono::steady_clock::now();
    auto stream = runner.stream(shell("echo hi; sleep 3 &"));
    std::string text = collect(*stream);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(text, "hi\n");
    EXPECT_EQ(stream->exit_code(), 0);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(OutputStreamTest, TerminateStopsLongRunningProcess) {
    LocalProcessRunner runner = make_runner();

    auto stream = runner.stream(shell("echo started; exec sleep 30"));
    ASSERT_TRUE(stream->next().has_value());
    stream->terminate();

    collect(*stream);
    EXPECT_EQ(stream->exit_code(), 128 + SIGTERM);
}

TEST(OutputStreamTest, AbandonedStreamLetsProcessFinish) {
    LocalProcessRunner runner = make_runner();
    {
        auto stream = runner.stream(shell("echo begin; i=0; while [ $i -lt 2000 ]; do echo more; i=$((i+1)); done"));
        ASSERT_TRUE(stream->next().has_value());
    }
    // Nothing to assert on the child itself; the runner must stay usable.
    EXPECT_EQ(runner.execute(shell("echo again")).std_out, "again\n");
}

TEST(TextOutputStreamTest, YieldsChunksThenEnds) {
    TextOutputStream stream({"a", "b"});
    EXPECT_EQ(stream.next(), std::string("a"));
    EXPECT_EQ(stream.next(), std::string("b"));
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_FALSE(stream.exit_code().has_value());
}

TEST(ResolveExecutableTest, SearchesPath) {
    EXPECT_EQ(resolve_executable("sh", {{"PATH", "/nonexistent:/bin"}}), "/bin/sh");
    EXPECT_THROW(resolve_executable("sh", {{"PATH", "/nonexistent"}}), LaunchFailure);
    EXPECT_THROW(resolve_executable("", {}), LaunchFailure);
}
