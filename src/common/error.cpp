#include "error.h"

#include <absl/strings/cord.h>

namespace supportpulse {

namespace {

constexpr std::string_view kErrorCodePayload = "type.supportpulse.dev/error_code";
constexpr std::string_view kReasonPayload = "type.supportpulse.dev/reason";

constexpr ErrorCode kAllCodes[] = {
    ErrorCode::kOk,
    ErrorCode::kUnknown,
    ErrorCode::kInvalidArgument,
    ErrorCode::kNotFound,
    ErrorCode::kInternal,
    ErrorCode::kUnavailable,
    ErrorCode::kTimeout,
    ErrorCode::kConfigurationError,
    ErrorCode::kValidationError,
    ErrorCode::kModelUnavailable,
    ErrorCode::kScoringError,
    ErrorCode::kPredictionUnavailable,
    ErrorCode::kAggregatorUnavailable,
    ErrorCode::kInsightsBackendError,
};

ErrorCode FromAbslCode(absl::StatusCode code) {
    switch (code) {
        case absl::StatusCode::kOk:
            return ErrorCode::kOk;
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kUnavailable:
            return ErrorCode::kUnavailable;
        case absl::StatusCode::kDeadlineExceeded:
            return ErrorCode::kTimeout;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kConfigurationError;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
        case ErrorCode::kModelUnavailable:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kInternal:
        case ErrorCode::kScoringError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
        case ErrorCode::kPredictionUnavailable:
        case ErrorCode::kInsightsBackendError:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kAggregatorUnavailable:
            return absl::StatusCode::kResourceExhausted;
        case ErrorCode::kTimeout:
            return absl::StatusCode::kDeadlineExceeded;
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kUnknown: return "unknown";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kInternal: return "internal_error";
        case ErrorCode::kUnavailable: return "unavailable";
        case ErrorCode::kTimeout: return "timeout";
        case ErrorCode::kConfigurationError: return "configuration_error";
        case ErrorCode::kValidationError: return "validation_error";
        case ErrorCode::kModelUnavailable: return "model_unavailable";
        case ErrorCode::kScoringError: return "scoring_error";
        case ErrorCode::kPredictionUnavailable: return "prediction_unavailable";
        case ErrorCode::kAggregatorUnavailable: return "aggregator_unavailable";
        case ErrorCode::kInsightsBackendError: return "insights_backend_error";
    }
    return "unknown";
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), message);
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayload, absl::Cord(ErrorCodeName(code)));
    }
    return status;
}

absl::Status MakeError(ErrorCode code, std::string_view reason, std::string_view message) {
    absl::Status status = MakeError(code, message);
    if (!status.ok() && !reason.empty()) {
        status.SetPayload(kReasonPayload, absl::Cord(reason));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }
    auto payload = status.GetPayload(kErrorCodePayload);
    if (payload.has_value()) {
        const std::string name(*payload);
        for (ErrorCode code : kAllCodes) {
            if (ErrorCodeName(code) == name) {
                return code;
            }
        }
    }
    return FromAbslCode(status.code());
}

std::optional<std::string> GetErrorReason(const absl::Status& status) {
    auto payload = status.GetPayload(kReasonPayload);
    if (!payload.has_value()) {
        return std::nullopt;
    }
    return std::string(*payload);
}

}  // namespace supportpulse
