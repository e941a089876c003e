#pragma once

/// @file lexicon_models.h
/// @brief Word-level model families loaded from JSON artifacts
///
/// Three families are supported:
/// - keyword_intent: per-intent keyword sets, Laplace-smoothed confidence
/// - lexicon_sentiment: weighted lexicon with intensifiers and negators
/// - template_response: issue type and cue words to a reply template

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "registry/scoring_unit.h"

namespace supportpulse::registry {

/// @brief Lowercase ASCII words; apostrophes are dropped ("can't" -> "cant"),
///        every other non-alphanumeric character separates words
std::vector<std::string> Tokenize(std::string_view text);

// =============================================================================
// Keyword intent
// =============================================================================

struct KeywordIntentParameters {
    /// intent label -> keywords
    std::unordered_map<std::string, std::unordered_set<std::string>> intents;
    /// Hits added to the intent named like the request's issue type
    double issue_type_prior = 1.0;
    std::string default_intent = "general";
};

class KeywordIntentModel : public ScoringUnit {
public:
    KeywordIntentModel(ModelDescriptor descriptor, KeywordIntentParameters params);

    static absl::StatusOr<std::unique_ptr<KeywordIntentModel>> FromJson(
        ModelDescriptor descriptor, const nlohmann::json& parameters);

    absl::StatusOr<ModelScore> Score(std::string_view message, IssueType issue_type) override;
    const ModelDescriptor& Descriptor() const override { return descriptor_; }

private:
    ModelDescriptor descriptor_;
    KeywordIntentParameters params_;
};

// =============================================================================
// Lexicon sentiment
// =============================================================================

struct LexiconSentimentParameters {
    std::unordered_map<std::string, double> lexicon;
    /// Multiplier applied to the word right after the intensifier
    std::unordered_map<std::string, double> intensifiers;
    std::unordered_set<std::string> negators;
    double negation_factor = -0.5;
    size_t negation_window = 3;
    /// |score| at or below this is neutral
    double neutral_band = 0.5;
    double saturation = 2.0;
};

class LexiconSentimentModel : public ScoringUnit {
public:
    LexiconSentimentModel(ModelDescriptor descriptor, LexiconSentimentParameters params);

    static absl::StatusOr<std::unique_ptr<LexiconSentimentModel>> FromJson(
        ModelDescriptor descriptor, const nlohmann::json& parameters);

    /// @brief Raw polarity sum of a message
    double Polarity(std::string_view message) const;

    absl::StatusOr<ModelScore> Score(std::string_view message, IssueType issue_type) override;
    const ModelDescriptor& Descriptor() const override { return descriptor_; }

private:
    ModelDescriptor descriptor_;
    LexiconSentimentParameters params_;
};

// =============================================================================
// Template response
// =============================================================================

struct TemplateResponseParameters {
    /// issue type wire name -> template label
    std::unordered_map<std::string, std::string> templates;
    std::unordered_set<std::string> escalation_cues;
    std::string escalation_template = "apologize_and_escalate";
    std::string default_template = "general_acknowledgement";
    double base_confidence = 0.8;
};

class TemplateResponseModel : public ScoringUnit {
public:
    TemplateResponseModel(ModelDescriptor descriptor, TemplateResponseParameters params);

    static absl::StatusOr<std::unique_ptr<TemplateResponseModel>> FromJson(
        ModelDescriptor descriptor, const nlohmann::json& parameters);

    absl::StatusOr<ModelScore> Score(std::string_view message, IssueType issue_type) override;
    const ModelDescriptor& Descriptor() const override { return descriptor_; }

private:
    ModelDescriptor descriptor_;
    TemplateResponseParameters params_;
};

/// @brief Build a unit of the family named in the descriptor
absl::StatusOr<std::unique_ptr<ScoringUnit>> CreateScoringUnit(
    ModelDescriptor descriptor, const nlohmann::json& parameters);

/// @brief Artifacts registered when no model directory is configured
std::vector<nlohmann::json> BuiltinArtifacts();

}  // namespace supportpulse::registry
