#pragma once

#include "models.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Parsers for the free-text output of `brew`, `mas`, `du` and `xattr`. None of
// them throw on unexpected text: lines they do not recognise are skipped, as
// the upstream wording is not a stable contract.

std::string trim(const std::string& text);
std::vector<std::string> split_lines(const std::string& text);

// Trimmed, non-empty lines (pin lists, dependents, leaves).
std::vector<std::string> parse_lines(const std::string& text);

// `brew search --formulae --casks`
struct SectionHeading { bool casks; };
struct NameLine { std::vector<std::string> names; };
struct SkippedLine {};
using SearchLine = std::variant<SectionHeading, NameLine, SkippedLine>;

SearchLine classify_search_line(const std::string& line);
SearchResults parse_search_results(const std::string& output);

// `brew doctor`
struct WarningMarker { std::string category; };
struct ErrorMarker { std::string message; };
struct DetailLine { std::string text; };
using DoctorLine = std::variant<WarningMarker, ErrorMarker, DetailLine, SkippedLine>;

DoctorLine classify_doctor_line(const std::string& line);
std::vector<DiagnosticIssue> parse_doctor_output(const std::string& output);

// `brew cleanup`
CleanupResult parse_cleanup_output(const std::string& output);

// First "<number><unit>" in the text, unit one of B/KB/MB/GB (any case),
// converted with 1024-based multipliers.
std::optional<int64_t> parse_byte_size(const std::string& text);

// `mas list` / `mas search`: "<id>  <name> (<version>)"
std::optional<MasApp> parse_mas_line(const std::string& line);
std::vector<MasApp> parse_mas_list(const std::string& output);
std::vector<MasSearchResult> parse_mas_search(const std::string& output);

// `mas outdated`: "<id>  <name> (<old> -> <new>)"
std::optional<OutdatedMasApp> parse_mas_outdated_line(const std::string& line);
std::vector<OutdatedMasApp> parse_mas_outdated(const std::string& output);

// com.apple.quarantine payload "flags;hex-seconds;agent;uuid". The timestamp
// counts seconds from 2001-01-01T00:00:00Z.
std::optional<TimePoint> decode_quarantine_timestamp(const std::string& payload);

// The "<Name>.app" artifact listed under "==> Artifacts" by `brew info --cask`.
std::optional<std::string> parse_cask_artifact_app(const std::string& output);

// Size in bytes from `du -sk` output.
std::optional<int64_t> parse_du_kilobytes(const std::string& output);

// "Homebrew 4.2.0\n..." -> "4.2.0"
std::string parse_brew_version(const std::string& output);
