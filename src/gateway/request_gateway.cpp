/// @file request_gateway.cpp
/// @brief Request validation, inference dispatch and response shaping

#include "gateway/request_gateway.h"

#include <chrono>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace supportpulse::gateway {

using json = nlohmann::json;

GatewayConfig GatewayConfig::FromConfig(const Config& config) {
    GatewayConfig result;
    result.host = config.GetString("gateway.host", result.host);
    result.port = static_cast<int>(config.GetInt("gateway.port", result.port));
    result.threads = static_cast<int>(config.GetInt("gateway.threads", result.threads));

    const int64_t max_message = config.GetInt(
        "gateway.max_message_length", static_cast<int64_t>(result.max_message_length));
    if (max_message > 0) {
        result.max_message_length = static_cast<size_t>(max_message);
    }
    const int64_t max_body = config.GetInt(
        "gateway.max_body_bytes", static_cast<int64_t>(result.max_body_bytes));
    if (max_body > 0) {
        result.max_body_bytes = static_cast<size_t>(max_body);
    }
    if (result.threads <= 0) {
        result.threads = 8;
    }
    return result;
}

absl::StatusOr<inference::PredictionRequest> ParsePredictionRequest(
    std::string_view body, size_t max_message_length) {
    json parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return ValidationError("malformed_json", "Request body is not valid JSON");
    }
    if (!parsed.is_object()) {
        return ValidationError("invalid_body", "Request body must be a JSON object");
    }

    auto message = parsed.find("message");
    if (message == parsed.end() || message->is_null()) {
        return ValidationError("missing_message", "Field 'message' is required");
    }
    if (!message->is_string()) {
        return ValidationError("invalid_body", "Field 'message' must be a string");
    }
    const std::string& text = message->get_ref<const std::string&>();
    const std::string_view trimmed = absl::StripAsciiWhitespace(text);
    if (trimmed.empty()) {
        return ValidationError("empty_message", "Field 'message' must not be empty");
    }
    if (trimmed.size() > max_message_length) {
        return ValidationError("message_too_long",
                               absl::StrCat("Field 'message' exceeds ", max_message_length,
                                            " characters"));
    }

    auto issue_type = parsed.find("issue_type");
    if (issue_type == parsed.end() || issue_type->is_null()) {
        return ValidationError("missing_issue_type", "Field 'issue_type' is required");
    }
    if (!issue_type->is_string()) {
        return ValidationError("invalid_issue_type", "Field 'issue_type' must be a string");
    }
    auto type = ParseIssueType(issue_type->get_ref<const std::string&>());
    if (!type) {
        return ValidationError(
            "invalid_issue_type",
            absl::StrCat("Unknown issue_type '", issue_type->get_ref<const std::string&>(),
                         "'"));
    }

    inference::PredictionRequest request;
    request.message = text;
    request.issue_type = *type;
    return request;
}

HttpResponse ErrorResponse(const absl::Status& status) {
    switch (GetErrorCode(status)) {
        case ErrorCode::kValidationError:
        case ErrorCode::kInvalidArgument:
            return HttpResponse::BadRequest(
                GetErrorReason(status).value_or("invalid_body"), status.message());
        case ErrorCode::kPredictionUnavailable:
        case ErrorCode::kModelUnavailable:
            return HttpResponse::Error(503, "prediction_unavailable", status.message());
        default:
            return HttpResponse::InternalError();
    }
}

RequestGateway::RequestGateway(
    std::shared_ptr<const inference::InferenceOrchestrator> orchestrator,
    std::shared_ptr<const registry::ModelRegistry> registry,
    std::shared_ptr<analytics::AnalyticsSink> sink,
    GatewayConfig config,
    std::shared_ptr<actions::ActionManager> actions)
    : orchestrator_(std::move(orchestrator)),
      registry_(std::move(registry)),
      sink_(std::move(sink)),
      config_(std::move(config)),
      actions_(std::move(actions)) {}

HttpResponse RequestGateway::HandlePredict(const HttpRequest& request) {
    ScopedTimer timer(SUPPORTPULSE_HISTOGRAM("predict_latency_seconds"));
    SUPPORTPULSE_COUNTER("predict_requests_total").Increment();

    if (request.body.size() > config_.max_body_bytes) {
        SUPPORTPULSE_COUNTER("predict_rejected_total").Increment();
        return HttpResponse::BadRequest(
            "message_too_long",
            absl::StrCat("Request body exceeds ", config_.max_body_bytes, " bytes"));
    }

    auto parsed = ParsePredictionRequest(request.body, config_.max_message_length);
    if (!parsed.ok()) {
        SUPPORTPULSE_COUNTER("predict_rejected_total").Increment();
        SUPPORTPULSE_LOG_DEBUG("Rejected prediction request: {}", parsed.status().message());
        return ErrorResponse(parsed.status());
    }

    absl::StatusOr<inference::Prediction> prediction;
    try {
        prediction = orchestrator_->Infer(*parsed);
    } catch (const std::exception& e) {
        SUPPORTPULSE_LOG_ERROR("Inference raised: {}", e.what());
        SUPPORTPULSE_COUNTER("predict_errors_total").Increment();
        return HttpResponse::InternalError();
    } catch (...) {
        SUPPORTPULSE_LOG_ERROR("Inference raised a non-standard exception");
        SUPPORTPULSE_COUNTER("predict_errors_total").Increment();
        return HttpResponse::InternalError();
    }
    if (!prediction.ok()) {
        SUPPORTPULSE_COUNTER("predict_errors_total").Increment();
        SUPPORTPULSE_LOG_WARN("Prediction failed: {}", prediction.status().message());
        return ErrorResponse(prediction.status());
    }

    const std::chrono::duration<double, std::milli> latency = timer.Elapsed();

    if (sink_) {
        auto submitted = sink_->Submit(*prediction, latency.count());
        if (!submitted.ok()) {
            SUPPORTPULSE_LOG_WARN("Dropping analytics event: {}", submitted.message());
        }
    }
    if (actions_) {
        auto dispatched = actions_->Dispatch(*prediction);
        if (!dispatched.ok()) {
            SUPPORTPULSE_LOG_WARN("Skipping post-prediction actions: {}", dispatched.message());
        }
    }

    return HttpResponse::Ok(inference::ToJson(*prediction));
}

HttpResponse RequestGateway::HandleHealth(const HttpRequest& /*request*/) const {
    json missing = json::array();
    for (auto capability : registry_->MissingCapabilities()) {
        missing.push_back(registry::CapabilityName(capability));
    }

    json models = json::array();
    for (const auto& info : registry_->ListModels()) {
        models.push_back({
            {"name", info.descriptor.name},
            {"capability", registry::CapabilityName(info.descriptor.capability)},
            {"version", info.descriptor.version},
            {"family", info.descriptor.family},
            {"calls", info.stats.calls},
            {"failures", info.stats.failures},
        });
    }

    return HttpResponse::Ok(json{
        {"status", missing.empty() ? "ok" : "degraded"},
        {"missing_capabilities", missing},
        {"service", kServiceName},
        {"version", kServiceVersion},
        {"timestamp", FormatTimestamp(std::chrono::system_clock::now())},
        {"models", models},
    });
}

}  // namespace supportpulse::gateway
