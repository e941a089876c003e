/// @file escalation_action.cpp
/// @brief Escalation webhook client

#include "actions/escalation_action.h"

#include <absl/strings/str_cat.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "common/logging.h"

namespace supportpulse::actions {

EscalationConfig EscalationConfig::FromConfig(const Config& config) {
    EscalationConfig result;
    result.enabled = config.GetBool("actions.escalation.enabled", result.enabled);
    result.priority = static_cast<int>(
        config.GetInt("actions.escalation.priority", result.priority));
    result.webhook_url = config.GetString("actions.escalation.webhook_url", result.webhook_url);
    result.webhook_path =
        config.GetString("actions.escalation.webhook_path", result.webhook_path);

    const std::string level = config.GetString("actions.escalation.min_priority",
                                               LevelName(result.min_priority));
    if (auto parsed = ParseLevel(level)) {
        result.min_priority = *parsed;
    } else {
        SUPPORTPULSE_LOG_WARN("Unknown actions.escalation.min_priority '{}', using {}", level,
                              LevelName(result.min_priority));
    }

    const int64_t timeout_ms =
        config.GetInt("actions.escalation.timeout_ms", result.timeout.count());
    if (timeout_ms > 0) {
        result.timeout = std::chrono::milliseconds(timeout_ms);
    }
    return result;
}

EscalationAction::EscalationAction(EscalationConfig config) : config_(std::move(config)) {}

bool EscalationAction::ShouldExecute(const inference::Prediction& prediction) const {
    return prediction.recommended_priority >= config_.min_priority;
}

std::string EscalationAction::BuildPayload(const inference::Prediction& prediction) const {
    nlohmann::json body = {
        {"event", "escalation"},
        {"prediction", inference::ToJson(prediction)},
    };
    return body.dump();
}

absl::Status EscalationAction::Execute(const inference::Prediction& prediction) {
    if (config_.webhook_url.empty()) {
        SUPPORTPULSE_LOG_WARN("Escalation: {} priority {} case ({} satisfaction)",
                              LevelName(prediction.recommended_priority),
                              IssueTypeName(prediction.issue_type),
                              LevelName(prediction.predicted_satisfaction));
        return absl::OkStatus();
    }

    httplib::Client client(config_.webhook_url);
    if (!client.is_valid()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid escalation webhook URL: ", config_.webhook_url));
    }

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(config_.timeout);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(config_.timeout - seconds);
    client.set_connection_timeout(seconds.count(), micros.count());
    client.set_read_timeout(seconds.count(), micros.count());
    client.set_write_timeout(seconds.count(), micros.count());

    auto result = client.Post(config_.webhook_path, BuildPayload(prediction), "application/json");
    if (!result) {
        return absl::UnavailableError(absl::StrCat(
            "Escalation webhook unreachable: ", httplib::to_string(result.error())));
    }
    if (result->status < 200 || result->status >= 300) {
        return absl::UnavailableError(
            absl::StrCat("Escalation webhook returned HTTP ", result->status));
    }

    SUPPORTPULSE_LOG_INFO("Escalated {} case to {}", IssueTypeName(prediction.issue_type),
                          config_.webhook_url);
    return absl::OkStatus();
}

}  // namespace supportpulse::actions
