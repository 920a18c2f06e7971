#include "environment.hpp"

extern char** environ;

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}

Environment current_environment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string pair(*entry);
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return env;
}

Environment build_environment(const Environment& inherited,
                              const Environment& proxy,
                              const Environment& overrides,
                              const std::vector<std::string>& path_prefixes) {
    Environment env = inherited;
    for (const auto& [key, value] : proxy) {
        env[key] = value;
    }
    for (const auto& [key, value] : overrides) {
        env[key] = value;
    }

    if (!path_prefixes.empty()) {
        std::string prefixes = join(path_prefixes, ":");
        auto path = env.find("PATH");
        if (path != env.end() && !path->second.empty()) {
            path->second = prefixes + ":" + path->second;
        } else {
            env["PATH"] = prefixes;
        }
    }
    return env;
}

std::vector<std::string> to_envp(const Environment& env) {
    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}
