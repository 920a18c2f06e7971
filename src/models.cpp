#include "models.hpp"
#include <array>
#include <cstdio>

const char* to_string(ServiceStatus status) {
    switch (status) {
    case ServiceStatus::Started: return "started";
    case ServiceStatus::Stopped: return "stopped";
    case ServiceStatus::Error: return "error";
    case ServiceStatus::Scheduled: return "scheduled";
    case ServiceStatus::None: return "none";
    case ServiceStatus::Unknown: break;
    }
    return "unknown";
}

const char* to_string(ServiceAction action) {
    switch (action) {
    case ServiceAction::Start: return "start";
    case ServiceAction::Stop: return "stop";
    case ServiceAction::Restart: return "restart";
    }
    return "start";
}

const char* to_string(PackageCategory category) {
    switch (category) {
    case PackageCategory::Development: return "Development";
    case PackageCategory::Productivity: return "Productivity";
    case PackageCategory::Utilities: return "Utilities";
    case PackageCategory::Media: return "Media & Graphics";
    case PackageCategory::Communication: return "Communication";
    case PackageCategory::Security: return "Security";
    case PackageCategory::Databases: return "Databases";
    case PackageCategory::Cloud: return "Cloud & DevOps";
    case PackageCategory::Browsers: return "Browsers";
    case PackageCategory::Other: break;
    }
    return "Other";
}

std::string format_bytes(int64_t bytes) {
    static const std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    char buffer[32];
    if (unit == 0) {
        std::snprintf(buffer, sizeof(buffer), "%lld B", static_cast<long long>(bytes));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
    }
    return buffer;
}
