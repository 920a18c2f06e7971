#pragma once

#include "models.hpp"
#include <map>
#include <string>
#include <vector>

// Popular packages from the formulae.brew.sh analytics feeds.
class AnalyticsClient {
public:
    static constexpr size_t FEED_LIMIT = 100;
    static constexpr size_t CATEGORY_LIMIT = 15;
    static constexpr long TIMEOUT_SECONDS = 30;

    AnalyticsClient(std::string formula_url, std::string cask_url);

    // Both feeds merged, most installed first. A feed that cannot be fetched
    // or decoded contributes nothing.
    std::vector<PopularPackage> popular_packages();
    std::map<PackageCategory, std::vector<PopularPackage>> popular_by_category();

private:
    std::vector<PopularPackage> fetch_feed(const std::string& url, bool is_cask);

    std::string formula_url_;
    std::string cask_url_;
};

// Body of a successful GET. Throws NetworkError.
std::string http_get(const std::string& url);

// Keyword match of a package name against well-known tools.
PackageCategory category_for(const std::string& package_name);
