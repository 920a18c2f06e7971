#pragma once

#include "environment.hpp"
#include "process_runner.hpp"
#include <map>
#include <string>
#include <vector>

// System proxy configuration as printed by `scutil --proxy`.
struct ProxySettings {
    std::map<std::string, std::string> values;
    std::vector<std::string> exceptions;
};

ProxySettings parse_scutil_proxy(const std::string& output);

// HTTP_PROXY, HTTPS_PROXY, ALL_PROXY and NO_PROXY, each in upper and lower case.
Environment proxy_environment(const ProxySettings& settings);

// Empty when the settings tool is missing or fails.
Environment discover_proxy_environment(ProcessRunner& runner, const std::string& scutil_path);
