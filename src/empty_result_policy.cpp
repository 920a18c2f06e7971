#include "empty_result_policy.hpp"
#include "text_parsers.hpp"
#include <algorithm>
#include <stdexcept>

const std::vector<EmptyResultRule>& empty_result_rules() {
    static const std::vector<EmptyResultRule> rules = {
        {EmptyResultOperation::PinnedList, {"No pinned"}, {}, true, false},
        {EmptyResultOperation::Dependents, {"No formulae"}, {}, true, false},
        {EmptyResultOperation::CaskListing, {}, {"No casks to list"}, true, true},
        {EmptyResultOperation::MasOutdated, {}, {}, true, false},
    };
    return rules;
}

const EmptyResultRule& empty_result_rule(EmptyResultOperation operation) {
    const auto& rules = empty_result_rules();
    auto rule = std::find_if(rules.begin(), rules.end(),
                             [operation](const EmptyResultRule& r) { return r.operation == operation; });
    if (rule == rules.end()) {
        throw std::logic_error("no empty-result rule for operation");
    }
    return *rule;
}

static bool mentions_any(const std::string& text, const std::vector<std::string>& phrases) {
    return std::any_of(phrases.begin(), phrases.end(),
                       [&text](const std::string& phrase) { return text.find(phrase) != std::string::npos; });
}

bool is_empty_result(EmptyResultOperation operation, const ExecutionResult& result) {
    const EmptyResultRule& rule = empty_result_rule(operation);
    if (result.success() && !rule.overrides_exit_code) {
        return false;
    }

    if (rule.empty_stdout_is_empty && trim(result.std_out).empty()) return true;
    if (mentions_any(result.std_out, rule.stdout_phrases)) return true;
    if (mentions_any(result.std_err, rule.stderr_phrases)) return true;
    return false;
}
