/// @file error_test.cpp
/// @brief Tests for status helpers and propagation macros

#include <gtest/gtest.h>

#include "common/error.h"

namespace flaresignal {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    FLARESIGNAL_CHECK_OR_RETURN(value > 0,
                                MakeError(ErrorCode::kValidationError, "must be positive"));
    return value;
}

absl::StatusOr<int> Doubled(int value) {
    FLARESIGNAL_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    return parsed * 2;
}

absl::Status CheckBoth(int a, int b) {
    FLARESIGNAL_RETURN_IF_ERROR(ParsePositive(a).status());
    FLARESIGNAL_RETURN_IF_ERROR(ParsePositive(b).status());
    return absl::OkStatus();
}

TEST(ErrorTest, CodeMapping) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kOk), absl::StatusCode::kOk);
    EXPECT_EQ(ToAbslCode(ErrorCode::kParseError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kValidationError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(static_cast<ErrorCode>(99)), absl::StatusCode::kUnknown);
    EXPECT_EQ(ToAbslCode(ErrorCode::kNotFound), absl::StatusCode::kNotFound);
    EXPECT_EQ(ToAbslCode(ErrorCode::kUnknown), absl::StatusCode::kUnknown);
}

TEST(ErrorTest, MakeErrorKeepsMessage) {
    auto status = MakeError(ErrorCode::kParseError, "bad record");
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "bad record");
}

TEST(ErrorTest, AnnotateStatus) {
    auto annotated = AnnotateStatus(MakeError(ErrorCode::kParseError, "bad timestamp"),
                                    "Record 3");
    EXPECT_EQ(annotated.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(annotated.message(), "Record 3: bad timestamp");

    EXPECT_TRUE(AnnotateStatus(absl::OkStatus(), "Record 0").ok());
}

TEST(ErrorTest, AssignOrReturn) {
    auto ok = Doubled(21);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 42);

    auto failed = Doubled(-1);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.status().message(), "must be positive");
}

TEST(ErrorTest, ReturnIfError) {
    EXPECT_TRUE(CheckBoth(1, 2).ok());
    EXPECT_EQ(CheckBoth(1, 0).code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace flaresignal
