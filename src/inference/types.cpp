#include "inference/types.h"

namespace supportpulse::inference {

nlohmann::json ToJson(const Prediction& prediction) {
    return nlohmann::json{
        {"message", prediction.message},
        {"issue_type", IssueTypeName(prediction.issue_type)},
        {"predicted_satisfaction", LevelName(prediction.predicted_satisfaction)},
        {"recommended_priority", LevelName(prediction.recommended_priority)},
        {"confidence", prediction.confidence},
        {"timestamp", FormatTimestamp(prediction.timestamp)},
        {"intent", prediction.intent},
        {"sentiment", prediction.sentiment},
        {"response_template", prediction.response_template},
    };
}

}  // namespace supportpulse::inference
