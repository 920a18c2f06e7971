#include "command.hpp"
#include <sstream>
#include <utility>

CommandSpec::CommandSpec(std::string executable,
                         std::vector<std::string> arguments,
                         std::map<std::string, std::string> environment)
    : executable_(std::move(executable)),
      arguments_(std::move(arguments)),
      environment_(std::move(environment)) {}

std::string CommandSpec::to_string() const {
    std::stringstream ss;
    ss << executable_;
    for (const auto& arg : arguments_) {
        ss << " ";
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            ss << "\"" << arg << "\"";
        } else {
            ss << arg;
        }
    }
    return ss.str();
}

CommandSpec build_command(const std::string& executable,
                          const std::vector<std::string>& arguments,
                          const std::map<std::string, std::string>& extra_env) {
    return CommandSpec(executable, arguments, extra_env);
}
