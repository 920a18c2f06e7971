#include "json_decoders.hpp"
#include "analytics_client.hpp"
#include "brew_error.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

json parse_json(const std::string& text, const char* what) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedOutput(std::string(what) + ": " + e.what());
    }
}

json parse_envelope(const std::string& text, const char* what) {
    json envelope = parse_json(text, what);
    if (!envelope.is_object()) {
        throw MalformedOutput(std::string(what) + ": expected a {formulae, casks} object");
    }
    return envelope;
}

// Absent and null both mean "not provided".
std::optional<std::string> optional_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::vector<std::string> string_list(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return {};
    if (it->is_string()) return {it->get<std::string>()};
    return it->get<std::vector<std::string>>();
}

size_t array_length(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_array()) return 0;
    return it->size();
}

const json& section(const json& envelope, const char* key) {
    static const json empty = json::array();
    auto it = envelope.find(key);
    if (it == envelope.end() || it->is_null()) return empty;
    if (!it->is_array()) {
        throw MalformedOutput(std::string("\"") + key + "\" is not an array");
    }
    return *it;
}

Formula to_formula(const json& j) {
    Formula formula;
    formula.name = j.at("name").get<std::string>();
    formula.full_name = j.value("full_name", formula.name);
    formula.description = optional_string(j, "desc");
    formula.homepage = optional_string(j, "homepage");
    formula.dependencies = string_list(j, "dependencies");

    const json* installed = nullptr;
    auto installed_list = j.find("installed");
    if (installed_list != j.end() && installed_list->is_array() && !installed_list->empty()) {
        installed = &installed_list->front();
    }

    std::optional<std::string> stable;
    auto versions = j.find("versions");
    if (versions != j.end() && versions->is_object()) {
        stable = optional_string(*versions, "stable");
    }

    if (installed) {
        formula.version = installed->at("version").get<std::string>();
        formula.installed_as_dependency = installed->value("installed_as_dependency", false);
        auto time = installed->find("time");
        if (time != installed->end() && time->is_number_integer()) {
            formula.installed_on = std::chrono::system_clock::from_time_t(
                static_cast<std::time_t>(time->get<int64_t>()));
        }
    } else {
        formula.version = stable.value_or("unknown");
    }
    return formula;
}

Cask to_cask(const json& j) {
    Cask cask;
    cask.token = j.at("token").get<std::string>();
    cask.names = string_list(j, "name");
    cask.description = optional_string(j, "desc");
    cask.homepage = optional_string(j, "homepage");
    // "installed" holds the installed version and wins over the latest one.
    auto installed = optional_string(j, "installed");
    cask.version = installed ? *installed : j.at("version").get<std::string>();
    return cask;
}

OutdatedPackage to_outdated(const json& j, bool is_cask) {
    OutdatedPackage package;
    package.name = j.at("name").get<std::string>();
    auto installed_versions = string_list(j, "installed_versions");
    package.installed_version = installed_versions.empty() ? "unknown" : installed_versions.front();
    package.current_version = j.at("current_version").get<std::string>();
    package.is_cask = is_cask;
    package.pinned = !is_cask && j.value("pinned", false);
    return package;
}

int64_t parse_install_count(const std::string& count) {
    std::string digits;
    for (char c : count) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
    }
    if (digits.empty()) return 0;
    return std::stoll(digits);
}

} // namespace

ServiceStatus parse_service_status(const std::string& status) {
    std::string lower = status;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "started") return ServiceStatus::Started;
    if (lower == "stopped") return ServiceStatus::Stopped;
    if (lower == "error") return ServiceStatus::Error;
    if (lower == "scheduled") return ServiceStatus::Scheduled;
    if (lower == "none") return ServiceStatus::None;
    return ServiceStatus::Unknown;
}

std::vector<Formula> decode_formulae(const std::string& text) {
    json envelope = parse_envelope(text, "brew info");
    std::vector<Formula> formulae;
    try {
        for (const auto& item : section(envelope, "formulae")) {
            formulae.push_back(to_formula(item));
        }
    } catch (const json::exception& e) {
        throw MalformedOutput(std::string("formula record: ") + e.what());
    }
    return formulae;
}

std::vector<Cask> decode_casks(const std::string& text) {
    json envelope = parse_envelope(text, "brew info");
    std::vector<Cask> casks;
    try {
        for (const auto& item : section(envelope, "casks")) {
            casks.push_back(to_cask(item));
        }
    } catch (const json::exception& e) {
        throw MalformedOutput(std::string("cask record: ") + e.what());
    }
    return casks;
}

std::vector<OutdatedPackage> decode_outdated(const std::string& text) {
    json envelope = parse_envelope(text, "brew outdated");
    std::vector<OutdatedPackage> packages;
    try {
        for (const auto& item : section(envelope, "formulae")) {
            packages.push_back(to_outdated(item, false));
        }
        for (const auto& item : section(envelope, "casks")) {
            packages.push_back(to_outdated(item, true));
        }
    } catch (const json::exception& e) {
        throw MalformedOutput(std::string("outdated record: ") + e.what());
    }
    return packages;
}

std::vector<ServiceInfo> decode_services(const std::string& text) {
    json list = parse_json(text, "brew services");
    if (!list.is_array()) throw MalformedOutput("service list is not an array");

    std::vector<ServiceInfo> services;
    try {
        for (const auto& item : list) {
            ServiceInfo service;
            service.name = item.at("name").get<std::string>();
            auto status = optional_string(item, "status");
            service.status = status ? parse_service_status(*status) : ServiceStatus::Unknown;
            service.user = optional_string(item, "user");
            service.file = optional_string(item, "file");
            auto exit_code = item.find("exit_code");
            if (exit_code != item.end() && exit_code->is_number_integer()) {
                service.exit_code = exit_code->get<int>();
            }
            services.push_back(std::move(service));
        }
    } catch (const json::exception& e) {
        throw MalformedOutput(std::string("service record: ") + e.what());
    }
    return services;
}

std::vector<TapInfo> decode_taps(const std::string& text) {
    json list = parse_json(text, "brew tap-info");
    if (!list.is_array()) throw MalformedOutput("tap list is not an array");

    std::vector<TapInfo> taps;
    try {
        for (const auto& item : list) {
            TapInfo tap;
            tap.name = item.at("name").get<std::string>();
            tap.user = item.at("user").get<std::string>();
            tap.repo = item.at("repo").get<std::string>();
            tap.path = item.at("path").get<std::string>();
            tap.formula_count = array_length(item, "formula_names");
            tap.cask_count = array_length(item, "cask_tokens");
            tap.command_count = array_length(item, "command_files");
            tap.remote = optional_string(item, "remote");
            tap.official = item.value("official", false);
            taps.push_back(std::move(tap));
        }
    } catch (const json::exception& e) {
        throw MalformedOutput(std::string("tap record: ") + e.what());
    }
    return taps;
}

std::vector<PopularPackage> decode_analytics(const std::string& text, bool is_cask, size_t limit) {
    json response = parse_json(text, "analytics");
    std::vector<PopularPackage> packages;
    try {
        for (const auto& item : response.at("items")) {
            if (packages.size() >= limit) break;
            PopularPackage package;
            package.name = optional_string(item, "formula")
                               .value_or(optional_string(item, "cask").value_or(""));
            package.rank = item.at("number").get<int>();
            package.install_count = parse_install_count(item.at("count").get<std::string>());
            package.is_cask = is_cask;
            package.category = category_for(package.name);
            packages.push_back(std::move(package));
        }
    } catch (const json::exception& e) {
        throw MalformedOutput(std::string("analytics item: ") + e.what());
    }
    return packages;
}
