#pragma once

#include "process_runner.hpp"
#include <string>
#include <vector>

// Call sites where `brew`/`mas` signal "nothing to report" with a failing
// exit code or empty output.
enum class EmptyResultOperation {
    PinnedList,
    Dependents,
    CaskListing,
    MasOutdated
};

struct EmptyResultRule {
    EmptyResultOperation operation;
    std::vector<std::string> stderr_phrases;
    std::vector<std::string> stdout_phrases;
    // Empty stdout also counts as "nothing", even after a failure.
    bool empty_stdout_is_empty = true;
    // Checked before the exit code: an empty listing wins over a failure.
    bool overrides_exit_code = false;
};

const std::vector<EmptyResultRule>& empty_result_rules();

const EmptyResultRule& empty_result_rule(EmptyResultOperation operation);

// True when result should be read as an empty collection rather than an error.
bool is_empty_result(EmptyResultOperation operation, const ExecutionResult& result);
