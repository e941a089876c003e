/// @file lexicon_models.cpp
/// @brief Keyword, lexicon and template model families

#include "registry/lexicon_models.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <absl/strings/str_cat.h>

namespace supportpulse::registry {

using json = nlohmann::json;

namespace {

template <typename T>
T ValueOr(const json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    return it->get<T>();
}

std::unordered_set<std::string> WordSet(const json& array) {
    std::unordered_set<std::string> words;
    for (const auto& word : array) {
        words.insert(word.get<std::string>());
    }
    return words;
}

absl::Status ParametersError(const ModelDescriptor& descriptor, std::string_view detail) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid parameters for model '", descriptor.name, "' (",
                     descriptor.family, "): ", detail));
}

}  // namespace

std::vector<std::string> Tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;

    for (char raw : text) {
        const auto c = static_cast<unsigned char>(raw);
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (raw == '\'') {
            continue;
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

// =============================================================================
// KeywordIntentModel
// =============================================================================

KeywordIntentModel::KeywordIntentModel(ModelDescriptor descriptor, KeywordIntentParameters params)
    : descriptor_(std::move(descriptor)), params_(std::move(params)) {}

absl::StatusOr<std::unique_ptr<KeywordIntentModel>> KeywordIntentModel::FromJson(
    ModelDescriptor descriptor, const json& parameters) {
    try {
        KeywordIntentParameters params;
        if (!parameters.contains("intents") || !parameters["intents"].is_object()) {
            return ParametersError(descriptor, "'intents' must be an object");
        }
        for (const auto& [intent, keywords] : parameters["intents"].items()) {
            params.intents[intent] = WordSet(keywords);
        }
        params.issue_type_prior = ValueOr(parameters, "issue_type_prior", params.issue_type_prior);
        params.default_intent = ValueOr(parameters, "default_intent", params.default_intent);
        return std::make_unique<KeywordIntentModel>(std::move(descriptor), std::move(params));
    } catch (const json::exception& e) {
        return ParametersError(descriptor, e.what());
    }
}

absl::StatusOr<ModelScore> KeywordIntentModel::Score(std::string_view message,
                                                     IssueType issue_type) {
    std::unordered_map<std::string, double> hits;
    double total = 0.0;

    for (const auto& token : Tokenize(message)) {
        for (const auto& [intent, keywords] : params_.intents) {
            if (keywords.count(token) > 0) {
                hits[intent] += 1.0;
                total += 1.0;
            }
        }
    }

    // The caller's own classification counts as evidence
    const std::string prior_intent(IssueTypeName(issue_type));
    if (params_.issue_type_prior > 0.0 && params_.intents.count(prior_intent) > 0) {
        hits[prior_intent] += params_.issue_type_prior;
        total += params_.issue_type_prior;
    }

    std::string best = params_.default_intent;
    double top = 0.0;
    for (const auto& [intent, count] : hits) {
        // Ties resolve alphabetically so results do not depend on hash order
        if (count > top || (count == top && count > 0.0 && intent < best)) {
            best = intent;
            top = count;
        }
    }

    return ModelScore{best, (top + 1.0) / (total + 2.0)};
}

// =============================================================================
// LexiconSentimentModel
// =============================================================================

LexiconSentimentModel::LexiconSentimentModel(ModelDescriptor descriptor,
                                             LexiconSentimentParameters params)
    : descriptor_(std::move(descriptor)), params_(std::move(params)) {}

absl::StatusOr<std::unique_ptr<LexiconSentimentModel>> LexiconSentimentModel::FromJson(
    ModelDescriptor descriptor, const json& parameters) {
    try {
        LexiconSentimentParameters params;
        if (!parameters.contains("lexicon") || !parameters["lexicon"].is_object()) {
            return ParametersError(descriptor, "'lexicon' must be an object");
        }
        params.lexicon = parameters["lexicon"].get<std::unordered_map<std::string, double>>();
        if (parameters.contains("intensifiers")) {
            params.intensifiers =
                parameters["intensifiers"].get<std::unordered_map<std::string, double>>();
        }
        if (parameters.contains("negators")) {
            params.negators = WordSet(parameters["negators"]);
        }
        params.negation_factor = ValueOr(parameters, "negation_factor", params.negation_factor);
        params.negation_window = ValueOr(parameters, "negation_window", params.negation_window);
        params.neutral_band = ValueOr(parameters, "neutral_band", params.neutral_band);
        params.saturation = ValueOr(parameters, "saturation", params.saturation);

        if (params.saturation <= 0.0) {
            return ParametersError(descriptor, "'saturation' must be positive");
        }
        if (params.neutral_band < 0.0) {
            return ParametersError(descriptor, "'neutral_band' must not be negative");
        }
        return std::make_unique<LexiconSentimentModel>(std::move(descriptor), std::move(params));
    } catch (const json::exception& e) {
        return ParametersError(descriptor, e.what());
    }
}

double LexiconSentimentModel::Polarity(std::string_view message) const {
    const auto tokens = Tokenize(message);

    double score = 0.0;
    double pending_intensity = 1.0;
    size_t negation_left = 0;

    for (const auto& token : tokens) {
        if (auto it = params_.intensifiers.find(token); it != params_.intensifiers.end()) {
            pending_intensity *= it->second;
            continue;
        }
        if (params_.negators.count(token) > 0) {
            negation_left = params_.negation_window;
            pending_intensity = 1.0;
            continue;
        }

        if (auto it = params_.lexicon.find(token); it != params_.lexicon.end()) {
            double value = it->second * pending_intensity;
            if (negation_left > 0) {
                value *= params_.negation_factor;
                negation_left = 0;
            }
            score += value;
        } else if (negation_left > 0) {
            --negation_left;
        }
        pending_intensity = 1.0;
    }

    return score;
}

absl::StatusOr<ModelScore> LexiconSentimentModel::Score(std::string_view message,
                                                        IssueType /*issue_type*/) {
    const double score = Polarity(message);
    const double magnitude = std::fabs(score);
    const double strength = magnitude / (magnitude + params_.saturation);

    if (magnitude <= params_.neutral_band) {
        return ModelScore{"neutral", 1.0 - strength};
    }
    return ModelScore{score > 0.0 ? "positive" : "negative", strength};
}

// =============================================================================
// TemplateResponseModel
// =============================================================================

TemplateResponseModel::TemplateResponseModel(ModelDescriptor descriptor,
                                             TemplateResponseParameters params)
    : descriptor_(std::move(descriptor)), params_(std::move(params)) {}

absl::StatusOr<std::unique_ptr<TemplateResponseModel>> TemplateResponseModel::FromJson(
    ModelDescriptor descriptor, const json& parameters) {
    try {
        TemplateResponseParameters params;
        if (parameters.contains("templates")) {
            params.templates =
                parameters["templates"].get<std::unordered_map<std::string, std::string>>();
        }
        if (parameters.contains("escalation_cues")) {
            params.escalation_cues = WordSet(parameters["escalation_cues"]);
        }
        params.escalation_template =
            ValueOr(parameters, "escalation_template", params.escalation_template);
        params.default_template = ValueOr(parameters, "default_template", params.default_template);
        params.base_confidence = ValueOr(parameters, "base_confidence", params.base_confidence);

        if (params.base_confidence < 0.0 || params.base_confidence > 1.0) {
            return ParametersError(descriptor, "'base_confidence' must be within [0, 1]");
        }
        return std::make_unique<TemplateResponseModel>(std::move(descriptor), std::move(params));
    } catch (const json::exception& e) {
        return ParametersError(descriptor, e.what());
    }
}

absl::StatusOr<ModelScore> TemplateResponseModel::Score(std::string_view message,
                                                        IssueType issue_type) {
    size_t cues = 0;
    for (const auto& token : Tokenize(message)) {
        cues += params_.escalation_cues.count(token);
    }
    if (cues > 0) {
        const double confidence = std::min(0.95, 0.5 + 0.15 * static_cast<double>(cues));
        return ModelScore{params_.escalation_template, confidence};
    }

    auto it = params_.templates.find(std::string(IssueTypeName(issue_type)));
    if (it != params_.templates.end()) {
        return ModelScore{it->second, params_.base_confidence};
    }
    return ModelScore{params_.default_template, 0.5};
}

// =============================================================================
// Factory
// =============================================================================

absl::StatusOr<std::unique_ptr<ScoringUnit>> CreateScoringUnit(
    ModelDescriptor descriptor, const json& parameters) {
    if (descriptor.family == "keyword_intent") {
        auto unit = KeywordIntentModel::FromJson(std::move(descriptor), parameters);
        if (!unit.ok()) return unit.status();
        return std::unique_ptr<ScoringUnit>(std::move(*unit));
    }
    if (descriptor.family == "lexicon_sentiment") {
        auto unit = LexiconSentimentModel::FromJson(std::move(descriptor), parameters);
        if (!unit.ok()) return unit.status();
        return std::unique_ptr<ScoringUnit>(std::move(*unit));
    }
    if (descriptor.family == "template_response") {
        auto unit = TemplateResponseModel::FromJson(std::move(descriptor), parameters);
        if (!unit.ok()) return unit.status();
        return std::unique_ptr<ScoringUnit>(std::move(*unit));
    }
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown model family: '", descriptor.family, "'"));
}

std::vector<json> BuiltinArtifacts() {
    json intent = {
        {"name", "support-intent"},
        {"capability", "intent"},
        {"version", "1.0.0"},
        {"family", "keyword_intent"},
        {"parameters", {
            {"intents", {
                {"account_access", {"login", "log", "logged", "password", "account",
                                    "locked", "signin", "sign", "access", "reset", "username"}},
                {"billing", {"bill", "billing", "charge", "charged", "invoice", "payment",
                             "refund", "price", "subscription", "card", "overcharged"}},
                {"shipping", {"delivery", "deliver", "delivered", "shipping", "shipped",
                              "package", "parcel", "tracking", "arrive", "arrived", "order"}},
                {"technical_support", {"error", "crash", "crashes", "bug", "install",
                                       "update", "app", "broken", "working", "loading"}},
                {"complaint", {"terrible", "awful", "worst", "unacceptable", "complaint",
                               "disappointed", "frustrated", "angry", "ridiculous"}},
                {"compliment", {"thanks", "thank", "great", "love", "excellent", "amazing",
                                "helpful", "awesome", "appreciate"}},
            }},
            {"issue_type_prior", 1.0},
            {"default_intent", "general"},
        }},
    };

    json sentiment = {
        {"name", "support-sentiment"},
        {"capability", "sentiment"},
        {"version", "1.0.0"},
        {"family", "lexicon_sentiment"},
        {"parameters", {
            {"lexicon", {
                {"good", 1.0}, {"great", 2.0}, {"excellent", 2.5}, {"love", 2.0},
                {"thanks", 1.5}, {"thank", 1.5}, {"happy", 2.0}, {"helpful", 1.5},
                {"amazing", 2.5}, {"awesome", 2.5}, {"perfect", 2.5}, {"appreciate", 1.5},
                {"satisfied", 2.0}, {"resolved", 1.0}, {"fast", 1.0}, {"quick", 1.0},
                {"bad", -1.5}, {"terrible", -2.5}, {"awful", -2.5}, {"worst", -3.0},
                {"hate", -2.5}, {"angry", -2.0}, {"frustrated", -2.0}, {"frustrating", -2.0},
                {"annoyed", -1.5}, {"disappointed", -2.0}, {"broken", -1.5}, {"slow", -1.0},
                {"problem", -1.0}, {"error", -1.0}, {"cannot", -1.0}, {"cant", -1.0},
                {"unable", -1.0}, {"wrong", -1.0}, {"unacceptable", -2.5},
                {"ridiculous", -2.0}, {"useless", -2.0}, {"late", -1.0}, {"locked", -1.0},
            }},
            {"intensifiers", {
                {"very", 1.5}, {"really", 1.5}, {"so", 1.3}, {"super", 1.5},
                {"extremely", 2.0}, {"totally", 1.5}, {"absolutely", 1.8},
            }},
            {"negators", {"not", "no", "never", "dont", "doesnt", "didnt", "isnt",
                          "wasnt", "wont", "nothing"}},
            {"negation_factor", -0.5},
            {"negation_window", 3},
            {"neutral_band", 0.5},
            {"saturation", 2.0},
        }},
    };

    json response = {
        {"name", "support-response"},
        {"capability", "response_template"},
        {"version", "1.0.0"},
        {"family", "template_response"},
        {"parameters", {
            {"templates", {
                {"general", "general_acknowledgement"},
                {"account_access", "account_recovery_steps"},
                {"billing", "billing_review"},
                {"shipping", "shipment_status_update"},
                {"technical_support", "troubleshooting_guide"},
                {"complaint", "apologize_and_escalate"},
                {"compliment", "thank_customer"},
            }},
            {"escalation_cues", {"frustrated", "angry", "unacceptable", "worst", "terrible",
                                 "furious", "cancel", "lawyer"}},
            {"escalation_template", "apologize_and_escalate"},
            {"default_template", "general_acknowledgement"},
            {"base_confidence", 0.8},
        }},
    };

    return {intent, sentiment, response};
}

}  // namespace supportpulse::registry
