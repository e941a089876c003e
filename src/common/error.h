#pragma once

/// @file error.h
/// @brief SupportPulse error taxonomy on top of absl::Status
///
/// Every error produced by the service is an absl::Status whose canonical
/// code follows ToAbslCode(). Two payloads travel with it:
/// - the taxonomy code (see ErrorCode), so callers can tell a missing model
///   from a failing one even though both are "not ok";
/// - an optional machine-readable reason ("invalid_issue_type", ...) that the
///   HTTP boundary reports as `error_code`.

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace supportpulse {

/// @brief Error taxonomy of the service
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kInternal,
    kUnavailable,
    kTimeout,
    kConfigurationError,

    // Request / inference pipeline
    kValidationError,        ///< Bad request shape or values, client fixable
    kModelUnavailable,       ///< Capability/version has no loaded artifact
    kScoringError,           ///< A single model failed mid-evaluation
    kPredictionUnavailable,  ///< The chain could not produce a prediction

    // Analytics / insights
    kAggregatorUnavailable,  ///< Analytics sink cannot accept events
    kInsightsBackendError,   ///< External text generation failed
};

/// @brief Convert an error code to its absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Stable name of an error code ("model_unavailable", ...)
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Create an error status tagged with the taxonomy code
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create an error status tagged with the taxonomy code and a reason
absl::Status MakeError(ErrorCode code, std::string_view reason, std::string_view message);

/// @brief Taxonomy code attached to a status. Statuses created outside
///        MakeError are classified from their canonical code.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief Machine-readable reason attached to a status, if any
std::optional<std::string> GetErrorReason(const absl::Status& status);

inline absl::Status ValidationError(std::string_view reason, std::string_view message) {
    return MakeError(ErrorCode::kValidationError, reason, message);
}

inline absl::Status ModelUnavailableError(std::string_view message) {
    return MakeError(ErrorCode::kModelUnavailable, "model_unavailable", message);
}

inline absl::Status ScoringError(std::string_view message) {
    return MakeError(ErrorCode::kScoringError, "scoring_error", message);
}

inline absl::Status PredictionUnavailableError(std::string_view message) {
    return MakeError(ErrorCode::kPredictionUnavailable, "prediction_unavailable", message);
}

inline absl::Status AggregatorUnavailableError(std::string_view message) {
    return MakeError(ErrorCode::kAggregatorUnavailable, "aggregator_unavailable", message);
}

inline absl::Status InsightsBackendError(std::string_view message) {
    return MakeError(ErrorCode::kInsightsBackendError, "insights_backend_error", message);
}

/// @brief Return if status is not OK
#define SUPPORTPULSE_RETURN_IF_ERROR(expr)                                     \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define SUPPORTPULSE_ASSIGN_OR_RETURN(lhs, rhs)                                \
    SUPPORTPULSE_ASSIGN_OR_RETURN_IMPL(                                        \
        SUPPORTPULSE_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define SUPPORTPULSE_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                 \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define SUPPORTPULSE_CONCAT(a, b) SUPPORTPULSE_CONCAT_IMPL(a, b)
#define SUPPORTPULSE_CONCAT_IMPL(a, b) a##b

}  // namespace supportpulse
