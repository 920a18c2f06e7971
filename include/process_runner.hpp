#pragma once

#include "command.hpp"
#include "environment.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Outcome of a completed, non-streaming run. Exit code 0 says nothing about
// whether the output is meaningful.
struct ExecutionResult {
    std::string std_out;
    std::string std_err;
    int exit_code = -1;

    bool success() const { return exit_code == 0; }
    std::string trimmed_output() const;
};

// Pull-based, forward-only sequence of output chunks. A chunk is a raw text
// fragment and may end in the middle of a line.
class OutputStream {
public:
    virtual ~OutputStream() = default;

    // Blocks until the next chunk is available. std::nullopt once exhausted.
    virtual std::optional<std::string> next() = 0;

    // Asks the producer to stop. Streams without a process behind them ignore it.
    virtual void terminate() {}

    // Exit code of the process behind the stream, once it has been reaped.
    virtual std::optional<int> exit_code() const { return std::nullopt; }
};

using OutputStreamPtr = std::unique_ptr<OutputStream>;

// Stream over chunks that are already known, for output produced in-process.
class TextOutputStream final : public OutputStream {
public:
    explicit TextOutputStream(std::vector<std::string> chunks);

    std::optional<std::string> next() override;

private:
    std::vector<std::string> chunks_;
    size_t position_ = 0;
};

// Drains a stream into a single string.
std::string collect(OutputStream& stream);

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs to completion, capturing stdout and stderr separately.
    // Throws LaunchFailure if the executable cannot be started.
    virtual ExecutionResult execute(const CommandSpec& command) = 0;

    // Starts the process and returns its combined stdout/stderr feed. The feed
    // ends when the process exits, whatever its exit code.
    virtual OutputStreamPtr stream(const CommandSpec& command) = 0;
};

struct RunnerOptions {
    std::vector<std::string> path_prefixes;
    Environment proxy;
};

class LocalProcessRunner final : public ProcessRunner {
public:
    LocalProcessRunner() = default;
    explicit LocalProcessRunner(RunnerOptions options);
    ~LocalProcessRunner() override = default;

    ExecutionResult execute(const CommandSpec& command) override;
    OutputStreamPtr stream(const CommandSpec& command) override;

    void set_proxy_environment(Environment proxy);

private:
    Environment environment_for(const CommandSpec& command) const;

    RunnerOptions options_;
};

// Full path of an executable, looked up in the PATH of env when the name has
// no slash. Throws LaunchFailure when nothing executable is found.
std::string resolve_executable(const std::string& name, const Environment& env);
