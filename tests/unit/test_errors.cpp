#include <gtest/gtest.h>
#include "core/errors/warden_errors.hpp"

using namespace warden::core::errors;

// Simulates a guard check that can fail
Result<std::string> simulate_guarded_read(bool should_fail) {
    if (should_fail) {
        return WardenError{ErrorCategory::Policy, "Path is outside the allowed working directory",
                           "access_denied"};
    }
    return std::string("file contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_guarded_read(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_guarded_read(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Policy);
    EXPECT_EQ(error.code, "access_denied");
    EXPECT_EQ(error.message, "Path is outside the allowed working directory");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeToUnknown) {
    const WardenError error{ErrorCategory::Internal, "fork failed"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Config), "config");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
    EXPECT_EQ(to_string(ErrorCategory::Io), "io");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
