#pragma once

/// @file orchestrator.h
/// @brief Sequences model calls into a single Prediction

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "inference/types.h"
#include "registry/model_registry.h"

namespace supportpulse::inference {

/// @brief How stage scores combine into satisfaction and priority
struct CombinationPolicy {
    /// Minimum sentiment confidence for a polar satisfaction
    double satisfaction_threshold = 0.5;

    /// Sentiment labels read as negative / positive
    std::set<std::string> negative_labels = {"negative"};
    std::set<std::string> positive_labels = {"positive"};

    /// Issue types escalated to high priority when satisfaction is low
    std::set<IssueType> escalation_issue_types = {IssueType::kComplaint,
                                                  IssueType::kAccountAccess};

    Level Satisfaction(const registry::ModelScore& sentiment) const;
    Level Priority(IssueType issue_type, Level satisfaction) const;
};

/// @brief Orchestrator configuration
struct OrchestratorConfig {
    CombinationPolicy policy;

    /// Pinned model versions; unset resolves the highest loaded version
    std::optional<std::string> intent_version;
    std::optional<std::string> sentiment_version;
    std::optional<std::string> response_version;

    /// Read the `orchestrator.*` section
    static OrchestratorConfig FromConfig(const Config& config);
};

/// @brief Runs intent, sentiment and response scoring in fixed order
///
/// Stateless between calls and safe to share across request threads.
class InferenceOrchestrator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    InferenceOrchestrator(std::shared_ptr<const registry::ModelRegistry> registry,
                          OrchestratorConfig config = {},
                          Clock clock = nullptr);

    /// @brief Produce a prediction for a validated request
    /// @return PredictionUnavailable when a stage has no loaded model
    absl::StatusOr<Prediction> Infer(const PredictionRequest& request) const;

    const OrchestratorConfig& GetConfig() const { return config_; }

private:
    absl::StatusOr<registry::ModelScore> RunStage(registry::Capability capability,
                                                  const std::optional<std::string>& version,
                                                  const PredictionRequest& request) const;

    std::shared_ptr<const registry::ModelRegistry> registry_;
    OrchestratorConfig config_;
    Clock clock_;
};

}  // namespace supportpulse::inference
