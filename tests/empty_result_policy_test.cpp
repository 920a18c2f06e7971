#include "empty_result_policy.hpp"
#include <gtest/gtest.h>

TEST(EmptyResultPolicyTest, EveryOperationHasARule) {
    for (auto operation : {EmptyResultOperation::PinnedList, EmptyResultOperation::Dependents,
                           EmptyResultOperation::CaskListing, EmptyResultOperation::MasOutdated}) {
        EXPECT_EQ(empty_result_rule(operation).operation, operation);
    }
}

TEST(EmptyResultPolicyTest, SuccessIsNeverEmptyWithoutOverride) {
    ExecutionResult result{"", "", 0};
    EXPECT_FALSE(is_empty_result(EmptyResultOperation::PinnedList, result));
}

TEST(EmptyResultPolicyTest, FailureWithEmptyStdoutIsEmpty) {
    ExecutionResult result{"", "", 1};
    EXPECT_TRUE(is_empty_result(EmptyResultOperation::PinnedList, result));
    EXPECT_TRUE(is_empty_result(EmptyResultOperation::MasOutdated, result));
}

TEST(EmptyResultPolicyTest, StderrPhraseMarksEmpty) {
    ExecutionResult pinned{"noise", "Error: No pinned formulae", 1};
    EXPECT_TRUE(is_empty_result(EmptyResultOperation::PinnedList, pinned));

    ExecutionResult dependents{"noise", "No formulae found", 1};
    EXPECT_TRUE(is_empty_result(EmptyResultOperation::Dependents, dependents));
}

TEST(EmptyResultPolicyTest, RealFailureIsNotEmpty) {
    ExecutionResult result{"partial", "Error: permission denied", 1};
    EXPECT_FALSE(is_empty_result(EmptyResultOperation::PinnedList, result));
    EXPECT_FALSE(is_empty_result(EmptyResultOperation::Dependents, result));
}

TEST(EmptyResultPolicyTest, CaskListingOverridesExitCode) {
    ExecutionResult success_message{"No casks to list", "", 0};
    EXPECT_TRUE(is_empty_result(EmptyResultOperation::CaskListing, success_message));

    ExecutionResult failure_message{"Warning: No casks to list\n", "", 1};
    EXPECT_TRUE(is_empty_result(EmptyResultOperation::CaskListing, failure_message));

    ExecutionResult listing{R"({"casks": []})", "", 0};
    EXPECT_FALSE(is_empty_result(EmptyResultOperation::CaskListing, listing));
}
