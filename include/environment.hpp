#pragma once

#include <map>
#include <string>
#include <vector>

using Environment = std::map<std::string, std::string>;

// Snapshot of this process's environment.
Environment current_environment();

// Inherited environment, then proxy variables, then caller overrides (each
// layer wins ties against the previous one). PATH gets path_prefixes prepended.
Environment build_environment(const Environment& inherited,
                              const Environment& proxy,
                              const Environment& overrides,
                              const std::vector<std::string>& path_prefixes);

std::vector<std::string> to_envp(const Environment& env);

std::string join(const std::vector<std::string>& parts, const std::string& separator);
