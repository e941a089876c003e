#pragma once

/// @file types.h
/// @brief Request and prediction types of the inference pipeline

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "common/types.h"

namespace supportpulse::inference {

/// @brief A validated prediction request
struct PredictionRequest {
    std::string message;
    IssueType issue_type = IssueType::kGeneral;
};

/// @brief Outcome of one inference, immutable once built
struct Prediction {
    std::string message;
    IssueType issue_type = IssueType::kGeneral;
    Level predicted_satisfaction = Level::kMedium;
    Level recommended_priority = Level::kMedium;
    double confidence = 0.0;
    std::chrono::system_clock::time_point timestamp;

    // Informational stage labels; they never affect confidence
    std::string intent;
    std::string sentiment;
    std::string response_template;
};

/// @brief Response body of POST /predict
nlohmann::json ToJson(const Prediction& prediction);

}  // namespace supportpulse::inference
