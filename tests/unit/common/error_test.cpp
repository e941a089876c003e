/// @file error_test.cpp
/// @brief Tests for the SupportPulse error taxonomy

#include <gtest/gtest.h>

#include "common/error.h"

namespace supportpulse {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    if (value <= 0) {
        return ValidationError("not_positive", "value must be positive");
    }
    return value;
}

absl::Status Doubled(int value, int* out) {
    SUPPORTPULSE_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    *out = parsed * 2;
    return absl::OkStatus();
}

absl::Status Chained(int value) {
    int ignored = 0;
    SUPPORTPULSE_RETURN_IF_ERROR(Doubled(value, &ignored));
    return absl::OkStatus();
}

TEST(ErrorTest, ValidationErrorCarriesReason) {
    absl::Status status = ValidationError("invalid_issue_type", "unknown issue type 'refunds'");

    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kValidationError);
    ASSERT_TRUE(GetErrorReason(status).has_value());
    EXPECT_EQ(*GetErrorReason(status), "invalid_issue_type");
    EXPECT_EQ(status.message(), "unknown issue type 'refunds'");
}

TEST(ErrorTest, TaxonomyMapsToCanonicalCodes) {
    EXPECT_EQ(ModelUnavailableError("x").code(), absl::StatusCode::kNotFound);
    EXPECT_EQ(ScoringError("x").code(), absl::StatusCode::kInternal);
    EXPECT_EQ(PredictionUnavailableError("x").code(), absl::StatusCode::kUnavailable);
    EXPECT_EQ(AggregatorUnavailableError("x").code(), absl::StatusCode::kResourceExhausted);
    EXPECT_EQ(InsightsBackendError("x").code(), absl::StatusCode::kUnavailable);
}

TEST(ErrorTest, SameCanonicalCodeDistinguishedByPayload) {
    EXPECT_EQ(GetErrorCode(PredictionUnavailableError("x")), ErrorCode::kPredictionUnavailable);
    EXPECT_EQ(GetErrorCode(InsightsBackendError("x")), ErrorCode::kInsightsBackendError);
}

TEST(ErrorTest, PlainStatusClassifiedFromCanonicalCode) {
    EXPECT_EQ(GetErrorCode(absl::OkStatus()), ErrorCode::kOk);
    EXPECT_EQ(GetErrorCode(absl::DeadlineExceededError("slow")), ErrorCode::kTimeout);
    EXPECT_EQ(GetErrorCode(absl::NotFoundError("gone")), ErrorCode::kNotFound);
    EXPECT_EQ(GetErrorCode(absl::DataLossError("bits")), ErrorCode::kUnknown);
    EXPECT_FALSE(GetErrorReason(absl::InternalError("boom")).has_value());
}

TEST(ErrorTest, ErrorCodeNames) {
    EXPECT_EQ(ErrorCodeName(ErrorCode::kValidationError), "validation_error");
    EXPECT_EQ(ErrorCodeName(ErrorCode::kModelUnavailable), "model_unavailable");
    EXPECT_EQ(ErrorCodeName(ErrorCode::kInternal), "internal_error");
}

TEST(ErrorTest, PropagationMacros) {
    int out = 0;
    EXPECT_TRUE(Doubled(21, &out).ok());
    EXPECT_EQ(out, 42);

    absl::Status status = Chained(-1);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(*GetErrorReason(status), "not_positive");
}

}  // namespace
}  // namespace supportpulse
