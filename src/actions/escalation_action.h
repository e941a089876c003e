#pragma once

/// @file escalation_action.h
/// @brief Notification of high-priority predictions

#include <chrono>
#include <string>

#include "actions/action.h"
#include "common/config.h"
#include "common/types.h"

namespace supportpulse::actions {

/// @brief Escalation settings (`actions.escalation.*`)
struct EscalationConfig {
    bool enabled = true;
    int priority = 10;

    /// Lowest recommended priority that escalates
    Level min_priority = Level::kHigh;

    /// Base URL ("http://host:port") of the webhook; empty logs instead
    std::string webhook_url;
    std::string webhook_path = "/escalations";
    std::chrono::milliseconds timeout{3000};

    static EscalationConfig FromConfig(const Config& config);
};

/// @brief Notifies the support team about predictions that need attention
///
/// With a webhook configured, POSTs
/// `{"event": "escalation", "prediction": {...}}` and treats any non-2xx
/// answer as a failure. Without one, logs a warning line per escalation.
class EscalationAction : public Action {
public:
    explicit EscalationAction(EscalationConfig config = {});

    std::string Name() const override { return "escalation"; }
    bool ShouldExecute(const inference::Prediction& prediction) const override;
    absl::Status Execute(const inference::Prediction& prediction) override;

    /// @brief Webhook body for a prediction
    std::string BuildPayload(const inference::Prediction& prediction) const;

    const EscalationConfig& GetConfig() const { return config_; }

private:
    EscalationConfig config_;
};

}  // namespace supportpulse::actions
