#include "config.hpp"
#include "console.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string Config::default_path() {
    if (const char* explicit_path = std::getenv("BREWLINE_CONFIG")) {
        return explicit_path;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        return std::string(xdg) + "/brewline/config.json";
    }
    return expand_home("~/.config/brewline/config.json");
}

Config Config::load() {
    Config config = load_from(default_path());
    const char* debug = std::getenv("BREWLINE_DEBUG");
    if (debug && std::string(debug) == "1") {
        config.verbose = true;
    }
    return config;
}

Config Config::load_from(const std::string& path) {
    Config config;
    if (!fs::exists(path)) return config;

    std::ifstream config_file(path);
    if (!config_file) {
        print_error("Cannot read config file " + path + ", using defaults");
        return config;
    }

    try {
        json overrides = json::parse(config_file);
        if (!overrides.is_object()) {
            print_error("Config file " + path + " must contain a JSON object, using defaults");
            return config;
        }
        config.apply(overrides);
    } catch (const json::exception& e) {
        print_error("Invalid config file " + path + ": " + e.what());
        return Config();
    }
    return config;
}

void Config::apply(const json& overrides) {
    brew_paths = overrides.value("brew_paths", brew_paths);
    path_prefixes = overrides.value("path_prefixes", path_prefixes);
    application_dirs = overrides.value("application_dirs", application_dirs);
    mas_path = overrides.value("mas_path", mas_path);
    scutil_path = overrides.value("scutil_path", scutil_path);
    analytics_formula_url = overrides.value("analytics_formula_url", analytics_formula_url);
    analytics_cask_url = overrides.value("analytics_cask_url", analytics_cask_url);
    use_system_proxy = overrides.value("use_system_proxy", use_system_proxy);
    verbose = overrides.value("verbose", verbose);
}
