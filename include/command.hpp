#pragma once

#include <map>
#include <string>
#include <vector>

// A fully resolved invocation: executable, argument vector and environment
// overrides. Never passed through a shell.
class CommandSpec {
public:
    CommandSpec(std::string executable,
                std::vector<std::string> arguments,
                std::map<std::string, std::string> environment);

    const std::string& executable() const { return executable_; }
    const std::vector<std::string>& arguments() const { return arguments_; }
    const std::map<std::string, std::string>& environment() const { return environment_; }

    // Display form for logs; quoting here is cosmetic only.
    std::string to_string() const;

private:
    std::string executable_;
    std::vector<std::string> arguments_;
    std::map<std::string, std::string> environment_;
};

CommandSpec build_command(const std::string& executable,
                          const std::vector<std::string>& arguments,
                          const std::map<std::string, std::string>& extra_env = {});
