#include "path_resolver.hpp"
#include "brew_error.hpp"
#include "console.hpp"
#include "text_parsers.hpp"
#include <sys/stat.h>
#include <unistd.h>

bool is_executable_file(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }
    try {
        return resolve_executable(name, current_environment());
    } catch (const LaunchFailure&) {
        return std::nullopt;
    }
}

BrewPathResolver::BrewPathResolver(std::vector<std::string> known_paths)
    : known_paths_(std::move(known_paths)) {}

std::optional<std::string> BrewPathResolver::resolve() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (checked_) return cached_path_;

    for (const auto& path : known_paths_) {
        if (is_executable_file(path)) {
            print_debug("brew found at " + path);
            cached_path_ = path;
            checked_ = true;
            return cached_path_;
        }
    }

    cached_path_ = find_executable("brew");
    if (cached_path_) {
        print_debug("brew found on PATH at " + *cached_path_);
    } else {
        print_debug("brew not found");
    }
    checked_ = true;
    return cached_path_;
}

void BrewPathResolver::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_path_.reset();
    checked_ = false;
}

std::optional<std::string> BrewPathResolver::prefix(ProcessRunner& runner) {
    auto brew = resolve();
    if (!brew) return std::nullopt;

    ExecutionResult result = runner.execute(build_command(*brew, {"--prefix"}));
    if (result.success()) {
        std::string prefix = result.trimmed_output();
        if (!prefix.empty()) return prefix;
    }

    if (brew->rfind("/opt/homebrew", 0) == 0) return std::string("/opt/homebrew");
    if (brew->rfind("/usr/local", 0) == 0) return std::string("/usr/local");
    if (brew->rfind("/home/linuxbrew/.linuxbrew", 0) == 0) return std::string("/home/linuxbrew/.linuxbrew");
    return std::nullopt;
}

std::optional<std::string> BrewPathResolver::version(ProcessRunner& runner) {
    auto brew = resolve();
    if (!brew) return std::nullopt;

    ExecutionResult result = runner.execute(build_command(*brew, {"--version"}));
    if (!result.success()) return std::nullopt;
    std::string version = parse_brew_version(result.std_out);
    if (version.empty()) return std::nullopt;
    return version;
}
