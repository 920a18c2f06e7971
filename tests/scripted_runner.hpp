#pragma once

#include "brew_error.hpp"
#include "process_runner.hpp"
#include <cerrno>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// ProcessRunner that answers from a table keyed by the argument vector joined
// with spaces. Unknown commands fail with exit code 1 and no output.
class ScriptedRunner : public ProcessRunner {
public:
    void on(const std::string& arguments, ExecutionResult result) {
        results_[arguments] = std::move(result);
    }

    void on_stream(const std::string& arguments, std::vector<std::string> chunks) {
        streams_[arguments] = std::move(chunks);
    }

    void fail_launch(const std::string& arguments) {
        launch_failures_.push_back(arguments);
    }

    ExecutionResult execute(const CommandSpec& command) override {
        std::string key = record(command);
        check_launch(command, key);
        auto it = results_.find(key);
        if (it == results_.end()) return ExecutionResult{"", "", 1};
        return it->second;
    }

    OutputStreamPtr stream(const CommandSpec& command) override {
        std::string key = record(command);
        check_launch(command, key);
        auto it = streams_.find(key);
        std::vector<std::string> chunks = it == streams_.end() ? std::vector<std::string>{} : it->second;
        return std::make_unique<TextOutputStream>(std::move(chunks));
    }

    std::vector<std::string> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t count(const std::string& arguments) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& call : calls_) {
            if (call == arguments) ++n;
        }
        return n;
    }

private:
    std::string record(const CommandSpec& command) {
        std::string key;
        for (const auto& arg : command.arguments()) {
            if (!key.empty()) key += " ";
            key += arg;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(key);
        return key;
    }

    void check_launch(const CommandSpec& command, const std::string& key) {
        for (const auto& failure : launch_failures_) {
            if (failure == key) throw LaunchFailure(command.executable(), ENOENT);
        }
    }

    std::map<std::string, ExecutionResult> results_;
    std::map<std::string, std::vector<std::string>> streams_;
    std::vector<std::string> launch_failures_;
    std::mutex mutex_;
    std::vector<std::string> calls_;
};

inline ExecutionResult ok(const std::string& std_out) {
    return ExecutionResult{std_out, "", 0};
}

inline ExecutionResult failed(int exit_code, const std::string& std_out, const std::string& std_err) {
    return ExecutionResult{std_out, std_err, exit_code};
}
