#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct Config {
    static constexpr const char* DEFAULT_MAS_PATH = "mas";
    static constexpr const char* DEFAULT_SCUTIL_PATH = "/usr/sbin/scutil";
    static constexpr const char* ANALYTICS_FORMULA_URL =
        "https://formulae.brew.sh/api/analytics/install-on-request/30d.json";
    static constexpr const char* ANALYTICS_CASK_URL =
        "https://formulae.brew.sh/api/analytics/cask-install/30d.json";

    // Checked in order before falling back to a PATH search.
    std::vector<std::string> brew_paths = {
        "/opt/homebrew/bin/brew",
        "/usr/local/bin/brew",
        "/home/linuxbrew/.linuxbrew/bin/brew"
    };
    // Prepended to PATH for every launched process.
    std::vector<std::string> path_prefixes = {"/opt/homebrew/bin", "/usr/local/bin"};
    std::vector<std::string> application_dirs = {"/Applications", "~/Applications"};
    std::string mas_path = DEFAULT_MAS_PATH;
    std::string scutil_path = DEFAULT_SCUTIL_PATH;
    std::string analytics_formula_url = ANALYTICS_FORMULA_URL;
    std::string analytics_cask_url = ANALYTICS_CASK_URL;
    bool use_system_proxy = true;
    bool verbose = false;

    static Config load();
    static Config load_from(const std::string& path);
    static std::string default_path();

    void apply(const json& overrides);
};

std::string expand_home(const std::string& path);
