#pragma once

/// @file request_gateway.h
/// @brief /predict and /health request handling

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "actions/action_manager.h"
#include "analytics/analytics_sink.h"
#include "common/config.h"
#include "gateway/http_types.h"
#include "inference/orchestrator.h"
#include "registry/model_registry.h"

namespace supportpulse::gateway {

inline constexpr char kServiceName[] = "supportpulse";
inline constexpr char kServiceVersion[] = "1.0.0";

/// @brief HTTP gateway configuration (`gateway.*`)
struct GatewayConfig {
    std::string host = "0.0.0.0";
    int port = 8080;  ///< 0 binds an ephemeral port
    int threads = 8;

    /// Longest accepted message, in bytes after trimming
    size_t max_message_length = 5000;

    /// Largest accepted request body
    size_t max_body_bytes = 64 * 1024;

    static GatewayConfig FromConfig(const Config& config);
};

/// @brief Validate a /predict body
/// @return ValidationError whose reason is the wire error code
absl::StatusOr<inference::PredictionRequest> ParsePredictionRequest(
    std::string_view body, size_t max_message_length);

/// @brief Map a failure status to an error response
///
/// Validation errors keep their reason with 400, unavailable predictions
/// become 503 and everything else an opaque 500.
HttpResponse ErrorResponse(const absl::Status& status);

/// @brief Handles prediction and health requests
class RequestGateway {
public:
    /// @param sink Receiver of prediction events; may be null
    /// @param actions Post-prediction actions; may be null
    RequestGateway(std::shared_ptr<const inference::InferenceOrchestrator> orchestrator,
                   std::shared_ptr<const registry::ModelRegistry> registry,
                   std::shared_ptr<analytics::AnalyticsSink> sink,
                   GatewayConfig config = {},
                   std::shared_ptr<actions::ActionManager> actions = nullptr);

    /// @brief POST /predict
    HttpResponse HandlePredict(const HttpRequest& request);

    /// @brief GET /health
    HttpResponse HandleHealth(const HttpRequest& request) const;

    const GatewayConfig& GetConfig() const { return config_; }

private:
    std::shared_ptr<const inference::InferenceOrchestrator> orchestrator_;
    std::shared_ptr<const registry::ModelRegistry> registry_;
    std::shared_ptr<analytics::AnalyticsSink> sink_;
    GatewayConfig config_;
    std::shared_ptr<actions::ActionManager> actions_;
};

}  // namespace supportpulse::gateway
