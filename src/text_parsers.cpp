#include "text_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>
#include <sstream>

namespace {

const std::string FORMULAE_HEADING = "==> Formulae";
const std::string CASKS_HEADING = "==> Casks";
const std::string HEADING_MARKER = "==>";
const std::string WARNING_MARKER = "Warning:";
const std::string ERROR_MARKER = "Error:";
const std::string DOCTOR_FOOTER = "Please";
const std::string ARTIFACTS_HEADING = "==> Artifacts";

// Seconds between 1970-01-01 and 2001-01-01.
constexpr int64_t MAC_EPOCH_OFFSET = 978307200;

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// Digits only; nullopt when the value does not fit in int64_t.
std::optional<int64_t> parse_integer(const std::string& digits) {
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(digits.c_str(), &end, 10);
    if (errno == ERANGE || end == digits.c_str() || *end != '\0') return std::nullopt;
    return static_cast<int64_t>(value);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) tokens.push_back(token);
    return tokens;
}

std::string strip_marker(const std::string& line, const std::string& marker) {
    return trim(line.substr(marker.size()));
}

// Package name from a cleanup path: the segment after Cellar/ or Caskroom/,
// otherwise the last path segment up to the first space.
std::string removed_package_name(const std::string& line, const std::string& root) {
    size_t root_pos = line.find(root + "/");
    if (root_pos != std::string::npos) {
        size_t start = root_pos + root.size() + 1;
        size_t end = line.find_first_of("/ ", start);
        return line.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }
    size_t slash = line.rfind('/');
    std::string tail = slash == std::string::npos ? line : line.substr(slash + 1);
    return tail.substr(0, tail.find(' '));
}

bool compare_names(const std::string& a, const std::string& b) {
    return to_lower(a) < to_lower(b);
}

} // namespace

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> parse_lines(const std::string& text) {
    std::vector<std::string> names;
    for (const auto& line : split_lines(text)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) names.push_back(trimmed);
    }
    return names;
}

SearchLine classify_search_line(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) return SkippedLine{};
    if (starts_with(trimmed, FORMULAE_HEADING)) return SectionHeading{false};
    if (starts_with(trimmed, CASKS_HEADING)) return SectionHeading{true};
    if (starts_with(trimmed, HEADING_MARKER)) return SkippedLine{};
    return NameLine{split_whitespace(trimmed)};
}

SearchResults parse_search_results(const std::string& output) {
    SearchResults results;
    bool in_casks = false;

    for (const auto& line : split_lines(output)) {
        SearchLine parsed = classify_search_line(line);
        if (auto heading = std::get_if<SectionHeading>(&parsed)) {
            in_casks = heading->casks;
        } else if (auto names = std::get_if<NameLine>(&parsed)) {
            auto& target = in_casks ? results.casks : results.formulae;
            target.insert(target.end(), names->names.begin(), names->names.end());
        }
    }
    return results;
}

DoctorLine classify_doctor_line(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) return SkippedLine{};
    if (starts_with(trimmed, WARNING_MARKER)) return WarningMarker{strip_marker(trimmed, WARNING_MARKER)};
    if (starts_with(trimmed, ERROR_MARKER)) return ErrorMarker{strip_marker(trimmed, ERROR_MARKER)};
    if (starts_with(trimmed, DOCTOR_FOOTER)) return SkippedLine{};
    return DetailLine{trimmed};
}

std::vector<DiagnosticIssue> parse_doctor_output(const std::string& output) {
    std::vector<DiagnosticIssue> issues;
    std::string category;

    for (const auto& line : split_lines(output)) {
        DoctorLine parsed = classify_doctor_line(line);
        if (auto warning = std::get_if<WarningMarker>(&parsed)) {
            category = warning->category;
        } else if (auto error = std::get_if<ErrorMarker>(&parsed)) {
            issues.push_back({"Error", error->message, Severity::Error});
            category.clear();
        } else if (auto detail = std::get_if<DetailLine>(&parsed)) {
            if (!category.empty()) {
                issues.push_back({category, detail->text, Severity::Warning});
            }
        }
    }
    return issues;
}

CleanupResult parse_cleanup_output(const std::string& output) {
    CleanupResult result;

    for (const auto& line : split_lines(output)) {
        if (contains(line, "Removing:") || contains(line, "Would remove:")) {
            if (contains(line, "Caskroom")) {
                std::string name = removed_package_name(line, "Caskroom");
                if (!name.empty()) result.casks_removed.push_back(name);
            } else if (contains(line, ".rb") || contains(line, "Cellar")) {
                std::string name = removed_package_name(line, "Cellar");
                if (!name.empty()) result.formulae_removed.push_back(name);
            }
        }
        if (contains(line, "downloads")) {
            ++result.downloads_cleaned;
        }
        std::string lower = to_lower(line);
        if (contains(lower, "freed") || contains(lower, "would free")) {
            if (auto bytes = parse_byte_size(line)) {
                result.bytes_freed = *bytes;
            }
        }
    }
    return result;
}

std::optional<int64_t> parse_byte_size(const std::string& text) {
    static const std::regex pattern(R"((\d+(?:\.\d+)?)\s*(KB|MB|GB|B))", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) return std::nullopt;

    double number = std::strtod(match[1].str().c_str(), nullptr);
    std::string unit = to_lower(match[2].str());

    double multiplier = 1;
    if (unit == "kb") multiplier = 1024.0;
    else if (unit == "mb") multiplier = 1024.0 * 1024.0;
    else if (unit == "gb") multiplier = 1024.0 * 1024.0 * 1024.0;

    double bytes = number * multiplier;
    if (!(bytes < static_cast<double>(std::numeric_limits<int64_t>::max()))) return std::nullopt;
    return static_cast<int64_t>(bytes);
}

std::optional<MasApp> parse_mas_line(const std::string& line) {
    static const std::regex pattern(R"(^(\d+)\s+(.+?)\s+\((.+?)\)$)");
    std::string trimmed = trim(line);
    std::smatch match;
    if (!std::regex_match(trimmed, match, pattern)) return std::nullopt;
    auto id = parse_integer(match[1].str());
    if (!id) return std::nullopt;
    return MasApp{*id, match[2].str(), match[3].str()};
}

std::vector<MasApp> parse_mas_list(const std::string& output) {
    std::vector<MasApp> apps;
    for (const auto& line : split_lines(output)) {
        if (auto app = parse_mas_line(line)) apps.push_back(*app);
    }
    std::sort(apps.begin(), apps.end(),
              [](const MasApp& a, const MasApp& b) { return compare_names(a.name, b.name); });
    return apps;
}

std::vector<MasSearchResult> parse_mas_search(const std::string& output) {
    std::vector<MasSearchResult> results;
    for (const auto& line : split_lines(output)) {
        if (auto app = parse_mas_line(line)) {
            results.push_back({app->id, app->name, app->version, std::nullopt});
        }
    }
    return results;
}

std::optional<OutdatedMasApp> parse_mas_outdated_line(const std::string& line) {
    static const std::regex pattern(R"(^(\d+)\s+(.+?)\s+\((.+?)\s+->\s+(.+?)\)$)");
    std::string trimmed = trim(line);
    std::smatch match;
    if (!std::regex_match(trimmed, match, pattern)) return std::nullopt;
    auto id = parse_integer(match[1].str());
    if (!id) return std::nullopt;
    return OutdatedMasApp{*id, match[2].str(), match[3].str(), match[4].str()};
}

std::vector<OutdatedMasApp> parse_mas_outdated(const std::string& output) {
    std::vector<OutdatedMasApp> apps;
    for (const auto& line : split_lines(output)) {
        if (auto app = parse_mas_outdated_line(line)) apps.push_back(*app);
    }
    std::sort(apps.begin(), apps.end(),
              [](const OutdatedMasApp& a, const OutdatedMasApp& b) { return compare_names(a.name, b.name); });
    return apps;
}

std::optional<TimePoint> decode_quarantine_timestamp(const std::string& payload) {
    std::vector<std::string> fields;
    std::istringstream stream(payload);
    std::string field;
    while (std::getline(stream, field, ';')) fields.push_back(field);
    if (fields.size() < 2) return std::nullopt;

    std::string hex = trim(fields[1]);
    if (hex.empty() || hex.size() > 15 ||
        !std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        return std::nullopt;
    }

    int64_t seconds = std::strtoll(hex.c_str(), nullptr, 16);
    return std::chrono::system_clock::from_time_t(0) +
           std::chrono::seconds(MAC_EPOCH_OFFSET + seconds);
}

std::optional<std::string> parse_cask_artifact_app(const std::string& output) {
    std::vector<std::string> lines = split_lines(output);
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        if (!contains(lines[i], ARTIFACTS_HEADING)) continue;
        std::string next = trim(lines[i + 1]);
        size_t app = next.find(".app");
        if (app == std::string::npos) continue;
        return next.substr(0, app + 4);
    }
    return std::nullopt;
}

std::optional<int64_t> parse_du_kilobytes(const std::string& output) {
    std::vector<std::string> tokens = split_whitespace(output);
    if (tokens.empty()) return std::nullopt;
    const std::string& size = tokens.front();
    if (!std::all_of(size.begin(), size.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    auto kilobytes = parse_integer(size);
    if (!kilobytes || *kilobytes > std::numeric_limits<int64_t>::max() / 1024) return std::nullopt;
    return *kilobytes * 1024;
}

std::string parse_brew_version(const std::string& output) {
    std::vector<std::string> lines = parse_lines(output);
    if (lines.empty()) return "";
    const std::string prefix = "Homebrew ";
    const std::string& first = lines.front();
    return starts_with(first, prefix) ? first.substr(prefix.size()) : first;
}
