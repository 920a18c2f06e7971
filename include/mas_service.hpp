#pragma once

#include "models.hpp"
#include "process_runner.hpp"
#include <string>
#include <vector>

// Mac App Store applications through the `mas` command line tool. Listing
// calls return nothing when `mas` is not installed.
class MasService {
public:
    // path_prefixes are searched ahead of PATH, as the runner does.
    MasService(ProcessRunner& runner, std::string mas_path, std::vector<std::string> path_prefixes = {});

    bool available() const;

    std::vector<MasApp> installed_apps();
    std::vector<OutdatedMasApp> outdated_apps();
    std::vector<MasSearchResult> search(const std::string& query);

    OutputStreamPtr install(int64_t id);
    OutputStreamPtr upgrade_all();

private:
    ExecutionResult mas(const std::vector<std::string>& arguments);

    ProcessRunner& runner_;
    std::string mas_path_;
    std::vector<std::string> path_prefixes_;
};
