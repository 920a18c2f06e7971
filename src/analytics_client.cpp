#include "analytics_client.hpp"
#include "brew_error.hpp"
#include "console.hpp"
#include "json_decoders.hpp"
#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <future>
#include <mutex>

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

static std::once_flag curl_initialized;

std::string http_get(const std::string& url) {
    std::call_once(curl_initialized, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    CURL* curl = curl_easy_init();
    if (!curl) throw NetworkError(url, "curl_easy_init failed");

    std::string response_data;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, AnalyticsClient::TIMEOUT_SECONDS);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) throw NetworkError(url, curl_easy_strerror(res));
    return response_data;
}

PackageCategory category_for(const std::string& package_name) {
    static const std::vector<std::pair<PackageCategory, std::vector<std::string>>> keywords = {
        {PackageCategory::Development, {
            "git", "gh", "node", "python", "go", "rust", "ruby", "java", "openjdk", "vim", "neovim",
            "emacs", "cmake", "make", "gcc", "llvm", "swift", "kotlin", "maven", "gradle", "npm",
            "yarn", "pnpm", "composer", "pip", "cargo", "visual-studio-code", "sublime-text",
            "intellij-idea", "xcode", "iterm2", "warp", "docker", "podman", "lazygit", "typescript",
            "deno", "bun", "zig", "elixir", "erlang", "scala", "clojure", "flutter", "cocoapods",
            "fastlane", "swiftlint", "swiftformat"}},
        {PackageCategory::Productivity, {
            "notion", "obsidian", "evernote", "todoist", "things", "fantastical", "alfred", "raycast",
            "rectangle", "magnet", "bettertouchtool", "karabiner-elements", "microsoft-word",
            "microsoft-excel", "microsoft-powerpoint", "libreoffice", "cron", "busycal"}},
        {PackageCategory::Utilities, {
            "wget", "curl", "htop", "btop", "tmux", "tree", "jq", "yq", "ripgrep", "fd", "fzf", "bat",
            "eza", "lsd", "zoxide", "starship", "fish", "zsh", "the-unarchiver", "keka", "appcleaner",
            "stats", "mas", "trash", "coreutils", "findutils", "gnu-sed", "imageoptim", "handbrake",
            "yt-dlp"}},
        {PackageCategory::Media, {
            "ffmpeg", "imagemagick", "gimp", "inkscape", "blender", "vlc", "iina", "spotify",
            "audacity", "obs", "figma", "sketch", "adobe-creative-cloud", "davinci-resolve", "mpv",
            "plex", "jellyfin", "kodi"}},
        {PackageCategory::Communication, {
            "slack", "discord", "zoom", "microsoft-teams", "telegram", "signal", "whatsapp",
            "messenger", "skype", "webex", "element", "mattermost"}},
        {PackageCategory::Security, {
            "1password", "bitwarden", "lastpass", "keepassxc", "gpg", "gnupg", "openssl", "openssh",
            "wireguard", "openvpn", "tunnelblick", "little-snitch", "lulu", "malwarebytes", "clamav"}},
        {PackageCategory::Databases, {
            "postgresql", "mysql", "mariadb", "sqlite", "mongodb", "redis", "memcached",
            "elasticsearch", "cassandra", "couchdb", "neo4j", "dbeaver", "tableplus", "pgadmin4"}},
        {PackageCategory::Cloud, {
            "awscli", "azure-cli", "google-cloud-sdk", "terraform", "ansible", "pulumi", "kubectl",
            "helm", "minikube", "kind", "k9s", "lens", "vagrant", "packer", "consul", "vault",
            "nomad", "argocd", "flux"}},
        {PackageCategory::Browsers, {
            "google-chrome", "firefox", "brave-browser", "microsoft-edge", "arc", "opera", "vivaldi",
            "chromium", "tor-browser", "orion"}},
    };

    std::string name = package_name;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [category, words] : keywords) {
        for (const auto& word : words) {
            if (name.find(word) != std::string::npos) return category;
        }
    }
    return PackageCategory::Other;
}

AnalyticsClient::AnalyticsClient(std::string formula_url, std::string cask_url)
    : formula_url_(std::move(formula_url)), cask_url_(std::move(cask_url)) {}

std::vector<PopularPackage> AnalyticsClient::fetch_feed(const std::string& url, bool is_cask) {
    try {
        return decode_analytics(http_get(url), is_cask, FEED_LIMIT);
    } catch (const BrewError& e) {
        print_debug(std::string("analytics feed skipped: ") + e.what());
        return {};
    }
}

std::vector<PopularPackage> AnalyticsClient::popular_packages() {
    auto formulae = std::async(std::launch::async, &AnalyticsClient::fetch_feed, this, formula_url_, false);
    auto casks = std::async(std::launch::async, &AnalyticsClient::fetch_feed, this, cask_url_, true);

    std::vector<PopularPackage> packages = formulae.get();
    std::vector<PopularPackage> cask_packages = casks.get();
    packages.insert(packages.end(), cask_packages.begin(), cask_packages.end());

    std::stable_sort(packages.begin(), packages.end(),
                     [](const PopularPackage& a, const PopularPackage& b) {
                         return a.install_count > b.install_count;
                     });
    return packages;
}

std::map<PackageCategory, std::vector<PopularPackage>> AnalyticsClient::popular_by_category() {
    std::map<PackageCategory, std::vector<PopularPackage>> grouped;
    // Already ordered by install count, so the first entries per category win.
    for (const auto& package : popular_packages()) {
        auto& bucket = grouped[package.category];
        if (bucket.size() < CATEGORY_LIMIT) bucket.push_back(package);
    }
    return grouped;
}
