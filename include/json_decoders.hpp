#pragma once

#include "models.hpp"
#include <string>
#include <vector>

// Decoders for the JSON that `brew` prints. Each throws MalformedOutput when
// the text is not JSON or a required key is missing or mistyped.

// `brew info --installed --json=v2`: {"formulae": [...], "casks": [...]}
std::vector<Formula> decode_formulae(const std::string& text);
std::vector<Cask> decode_casks(const std::string& text);

// `brew outdated --json=v2`
std::vector<OutdatedPackage> decode_outdated(const std::string& text);

// `brew services list --json`: flat array
std::vector<ServiceInfo> decode_services(const std::string& text);

// `brew tap-info --json`: flat array
std::vector<TapInfo> decode_taps(const std::string& text);

// formulae.brew.sh analytics feed; at most `limit` items, in feed order.
std::vector<PopularPackage> decode_analytics(const std::string& text, bool is_cask, size_t limit);

ServiceStatus parse_service_status(const std::string& status);
