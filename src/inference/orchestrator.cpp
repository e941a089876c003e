/// @file orchestrator.cpp
/// @brief Inference orchestrator implementation

#include "inference/orchestrator.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace supportpulse::inference {

using registry::Capability;
using registry::ModelScore;

namespace {

std::optional<std::string> OptionalString(const Config& config, std::string_view key) {
    std::string value = config.GetString(key, "");
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

Level CombinationPolicy::Satisfaction(const ModelScore& sentiment) const {
    if (sentiment.confidence < satisfaction_threshold) {
        return Level::kMedium;
    }
    if (negative_labels.count(sentiment.label) > 0) {
        return Level::kLow;
    }
    if (positive_labels.count(sentiment.label) > 0) {
        return Level::kHigh;
    }
    return Level::kMedium;
}

Level CombinationPolicy::Priority(IssueType issue_type, Level satisfaction) const {
    if (satisfaction == Level::kLow && escalation_issue_types.count(issue_type) > 0) {
        return Level::kHigh;
    }
    if (satisfaction == Level::kHigh) {
        return Level::kLow;
    }
    return Level::kMedium;
}

OrchestratorConfig OrchestratorConfig::FromConfig(const Config& config) {
    OrchestratorConfig result;
    auto& policy = result.policy;

    policy.satisfaction_threshold = config.GetDouble(
        "orchestrator.satisfaction_threshold", policy.satisfaction_threshold);

    auto negative = config.GetStringList("orchestrator.negative_labels");
    if (!negative.empty()) {
        policy.negative_labels = {negative.begin(), negative.end()};
    }
    auto positive = config.GetStringList("orchestrator.positive_labels");
    if (!positive.empty()) {
        policy.positive_labels = {positive.begin(), positive.end()};
    }

    if (config.HasKey("orchestrator.escalation_issue_types")) {
        policy.escalation_issue_types.clear();
        for (const auto& name : config.GetStringList("orchestrator.escalation_issue_types")) {
            auto type = ParseIssueType(name);
            if (type) {
                policy.escalation_issue_types.insert(*type);
            } else {
                SUPPORTPULSE_LOG_WARN("Ignoring unknown escalation issue type '{}'", name);
            }
        }
    }

    result.intent_version = OptionalString(config, "orchestrator.versions.intent");
    result.sentiment_version = OptionalString(config, "orchestrator.versions.sentiment");
    result.response_version = OptionalString(config, "orchestrator.versions.response_template");
    return result;
}

InferenceOrchestrator::InferenceOrchestrator(
    std::shared_ptr<const registry::ModelRegistry> registry,
    OrchestratorConfig config,
    Clock clock)
    : registry_(std::move(registry)),
      config_(std::move(config)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

absl::StatusOr<ModelScore> InferenceOrchestrator::RunStage(
    Capability capability,
    const std::optional<std::string>& version,
    const PredictionRequest& request) const {
    std::optional<std::string_view> pinned;
    if (version.has_value()) {
        pinned = *version;
    }

    auto unit = registry_->Resolve(capability, pinned);
    if (!unit.ok()) {
        return PredictionUnavailableError(unit.status().message());
    }

    auto score = (*unit)->Score(request.message, request.issue_type);
    if (!score.ok()) {
        // A failing stage degrades to a neutral score; the chain continues
        SUPPORTPULSE_LOG_DEBUG("{} stage degraded: {}", registry::CapabilityName(capability),
                               score.status().message());
        return ModelScore{"unknown", 0.0};
    }
    return *score;
}

absl::StatusOr<Prediction> InferenceOrchestrator::Infer(const PredictionRequest& request) const {
    SUPPORTPULSE_ASSIGN_OR_RETURN(
        ModelScore intent, RunStage(Capability::kIntent, config_.intent_version, request));
    SUPPORTPULSE_ASSIGN_OR_RETURN(
        ModelScore sentiment,
        RunStage(Capability::kSentiment, config_.sentiment_version, request));
    SUPPORTPULSE_ASSIGN_OR_RETURN(
        ModelScore response,
        RunStage(Capability::kResponseTemplate, config_.response_version, request));

    const auto& policy = config_.policy;

    Prediction prediction;
    prediction.message = request.message;
    prediction.issue_type = request.issue_type;
    prediction.predicted_satisfaction = policy.Satisfaction(sentiment);
    prediction.recommended_priority =
        policy.Priority(request.issue_type, prediction.predicted_satisfaction);
    prediction.confidence = std::min(intent.confidence, sentiment.confidence);
    prediction.timestamp = clock_();
    prediction.intent = std::move(intent.label);
    prediction.sentiment = std::move(sentiment.label);
    prediction.response_template = std::move(response.label);
    return prediction;
}

}  // namespace supportpulse::inference
