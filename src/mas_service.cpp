#include "mas_service.hpp"
#include "brew_error.hpp"
#include "bulk_sequencer.hpp"
#include "empty_result_policy.hpp"
#include "path_resolver.hpp"
#include "text_parsers.hpp"

MasService::MasService(ProcessRunner& runner, std::string mas_path, std::vector<std::string> path_prefixes)
    : runner_(runner), mas_path_(std::move(mas_path)), path_prefixes_(std::move(path_prefixes)) {}

bool MasService::available() const {
    Environment env = build_environment(current_environment(), {}, {}, path_prefixes_);
    try {
        return is_executable_file(resolve_executable(mas_path_, env));
    } catch (const LaunchFailure&) {
        return false;
    }
}

ExecutionResult MasService::mas(const std::vector<std::string>& arguments) {
    return runner_.execute(build_command(mas_path_, arguments));
}

std::vector<MasApp> MasService::installed_apps() {
    if (!available()) return {};
    ExecutionResult result = mas({"list"});
    if (!result.success()) throw NonZeroExit(result.exit_code, trim(result.std_err));
    return parse_mas_list(result.std_out);
}

// `mas outdated` exits non-zero when there is nothing to update.
std::vector<OutdatedMasApp> MasService::outdated_apps() {
    if (!available()) return {};
    ExecutionResult result = mas({"outdated"});
    if (!result.success()) {
        if (is_empty_result(EmptyResultOperation::MasOutdated, result)) return {};
        throw NonZeroExit(result.exit_code, trim(result.std_err));
    }
    return parse_mas_outdated(result.std_out);
}

std::vector<MasSearchResult> MasService::search(const std::string& query) {
    if (!available() || query.empty()) return {};
    ExecutionResult result = mas({"search", query});
    if (!result.success()) throw NonZeroExit(result.exit_code, trim(result.std_err));
    return parse_mas_search(result.std_out);
}

OutputStreamPtr MasService::install(int64_t id) {
    std::string app_id = std::to_string(id);
    return sequence_streams({app_id}, INSTALL_VERB, [this](const std::string& item) {
        return runner_.stream(build_command(mas_path_, {"install", item}));
    });
}

OutputStreamPtr MasService::upgrade_all() {
    return sequence_streams({"Mac App Store apps"}, UPGRADE_VERB, [this](const std::string&) {
        return runner_.stream(build_command(mas_path_, {"upgrade"}));
    });
}
