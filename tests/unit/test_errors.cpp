#include <gtest/gtest.h>
#include "core/errors/compaction_errors.hpp"

using namespace logcompact::core::errors;

// A dummy function to simulate a store read failing
Result<std::string> simulate_read_log(bool should_fail) {
    if (should_fail) {
        return CompactionError{ErrorCategory::StoreRead, "Log not found"};
    }
    return std::string("{\"role\":\"user\",\"content\":\"hi\"}");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_log(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "{\"role\":\"user\",\"content\":\"hi\"}");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_log(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::StoreRead);
    EXPECT_EQ(error.message, "Log not found");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, ErrorKindNamesMatchReportVocabulary) {
    EXPECT_EQ(error_kind(ErrorCategory::Configuration), "ConfigurationError");
    EXPECT_EQ(error_kind(ErrorCategory::MalformedLog), "MalformedLogError");
    EXPECT_EQ(error_kind(ErrorCategory::StoreRead), "StoreReadError");
    EXPECT_EQ(error_kind(ErrorCategory::StoreWrite), "StoreWriteError");
}
