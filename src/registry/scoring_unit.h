#pragma once

/// @file scoring_unit.h
/// @brief Base interface for SupportPulse classification models

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "common/types.h"

namespace supportpulse::registry {

/// @brief What a model predicts
enum class Capability {
    kIntent,
    kSentiment,
    kResponseTemplate
};

inline constexpr Capability kAllCapabilities[] = {
    Capability::kIntent,
    Capability::kSentiment,
    Capability::kResponseTemplate,
};

/// "intent", "sentiment", "response_template"
std::string_view CapabilityName(Capability capability);

std::optional<Capability> ParseCapability(std::string_view name);

/// @brief Output of one model call
struct ModelScore {
    std::string label;
    double confidence = 0.0;  ///< 0.0 - 1.0
};

/// @brief Identity of a loaded model artifact
struct ModelDescriptor {
    std::string name;
    Capability capability = Capability::kIntent;
    std::string version;
    std::string family;
};

/// @brief Abstract base class for a callable model
///
/// Score() is synchronous and has no side effects beyond the unit's own
/// counters. Implementations may throw; ModelRegistry wraps every unit so
/// that callers only ever see a status.
class ScoringUnit {
public:
    virtual ~ScoringUnit() = default;

    virtual absl::StatusOr<ModelScore> Score(std::string_view message, IssueType issue_type) = 0;

    virtual const ModelDescriptor& Descriptor() const = 0;
};

}  // namespace supportpulse::registry
