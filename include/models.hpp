#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

struct Formula {
    std::string name;
    std::string full_name;
    std::string version;
    std::optional<std::string> description;
    std::optional<std::string> homepage;
    bool installed_as_dependency = false;
    std::vector<std::string> dependencies;
    std::optional<TimePoint> installed_on;
};

struct Cask {
    std::string token;
    std::vector<std::string> names;  // "name" is a string or an array upstream
    std::string version;
    std::optional<std::string> description;
    std::optional<std::string> homepage;

    const std::string& display_name() const { return names.empty() ? token : names.front(); }
};

struct OutdatedPackage {
    std::string name;
    std::string installed_version;
    std::string current_version;
    bool is_cask = false;
    bool pinned = false;
};

enum class ServiceStatus { Started, Stopped, Error, Unknown, Scheduled, None };

struct ServiceInfo {
    std::string name;
    ServiceStatus status = ServiceStatus::Unknown;
    std::optional<std::string> user;
    std::optional<std::string> file;
    std::optional<int> exit_code;

    bool is_active() const {
        return status == ServiceStatus::Started || status == ServiceStatus::Scheduled;
    }
};

enum class ServiceAction { Start, Stop, Restart };

const char* to_string(ServiceStatus status);
const char* to_string(ServiceAction action);

struct TapInfo {
    std::string name;
    std::string user;
    std::string repo;
    std::string path;
    size_t formula_count = 0;
    size_t cask_count = 0;
    size_t command_count = 0;
    std::optional<std::string> remote;
    bool official = false;

    size_t total_count() const { return formula_count + cask_count + command_count; }
};

struct SearchResults {
    std::vector<std::string> formulae;
    std::vector<std::string> casks;

    bool empty() const { return formulae.empty() && casks.empty(); }
};

struct CleanupResult {
    int64_t bytes_freed = 0;
    std::vector<std::string> formulae_removed;
    std::vector<std::string> casks_removed;
    int downloads_cleaned = 0;

    bool empty() const {
        return bytes_freed == 0 && formulae_removed.empty() &&
               casks_removed.empty() && downloads_cleaned == 0;
    }
};

enum class Severity { Warning, Error };

struct DiagnosticIssue {
    std::string category;
    std::string message;
    Severity severity = Severity::Warning;
};

struct DependencyNode {
    std::string name;
    std::vector<DependencyNode> children;
};

struct DependencyTree {
    std::string package_name;
    std::vector<DependencyNode> dependencies;
};

struct MasApp {
    int64_t id = 0;
    std::string name;
    std::string version;
};

struct OutdatedMasApp {
    int64_t id = 0;
    std::string name;
    std::string installed_version;
    std::string available_version;
};

struct MasSearchResult {
    int64_t id = 0;
    std::string name;
    std::string version;
    std::optional<std::string> price;

    bool is_free() const { return !price || *price == "0" || *price == "free" || *price == "Free"; }
};

struct QuarantinedApp {
    std::string name;
    std::string path;
    std::optional<std::string> cask_name;
    std::optional<TimePoint> quarantine_date;
};

struct DiskUsageInfo {
    int64_t cache_size = 0;
    int64_t cellar_size = 0;
    int64_t caskroom_size = 0;

    int64_t total_size() const { return cache_size + cellar_size + caskroom_size; }
};

enum class PackageCategory {
    Development, Productivity, Utilities, Media, Communication,
    Security, Databases, Cloud, Browsers, Other
};

const char* to_string(PackageCategory category);

struct PopularPackage {
    std::string name;
    int64_t install_count = 0;
    int rank = 0;
    bool is_cask = false;
    PackageCategory category = PackageCategory::Other;
};

// Human readable size, 1024-based ("1.5 MB").
std::string format_bytes(int64_t bytes);
