#pragma once

#include "process_runner.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Locates the brew executable. The first answer, found or not, is cached until
// invalidate().
class BrewPathResolver {
public:
    explicit BrewPathResolver(std::vector<std::string> known_paths);

    std::optional<std::string> resolve();
    void invalidate();
    bool is_installed() { return resolve().has_value(); }

    // `brew --prefix`, or a guess from the executable location.
    std::optional<std::string> prefix(ProcessRunner& runner);
    // `brew --version` without the "Homebrew " prefix.
    std::optional<std::string> version(ProcessRunner& runner);

private:
    std::vector<std::string> known_paths_;
    std::mutex mutex_;
    bool checked_ = false;
    std::optional<std::string> cached_path_;
};

bool is_executable_file(const std::string& path);

// Search of the current PATH, without launching anything.
std::optional<std::string> find_executable(const std::string& name);
