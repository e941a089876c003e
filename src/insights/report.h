#pragma once

/// @file report.h
/// @brief Insight reports and the single-slot cell holding the latest one

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "common/types.h"

namespace supportpulse::insights {

/// @brief Narrative summary of a metrics snapshot, immutable once built
struct InsightReport {
    std::chrono::system_clock::time_point generated_at;
    std::string title;
    std::string summary_text;
    std::vector<std::string> key_findings;
    std::vector<std::string> alerts;
    std::vector<std::string> recommendations;  ///< ordered
    std::string trends;
    Level severity = Level::kLow;
    int64_t data_points = 0;
    size_t based_on_bucket_count = 0;
    bool degraded = false;
    std::string source;  ///< "llm", "rule_based" or "placeholder"
};

nlohmann::json ToJson(const InsightReport& report);

/// @brief Narrative fields read from a backend reply
struct GeneratedNarrative {
    std::string title;
    std::string overview;
    std::vector<std::string> key_findings;
    std::vector<std::string> alerts;
    std::vector<std::string> recommendations;
    std::string trends;
};

/// @brief Parse the JSON object between the first '{' and the last '}'
/// @return InsightsBackendError if no usable object is found
absl::StatusOr<GeneratedNarrative> ParseNarrative(std::string_view reply);

/// @brief Report served before the first generation completes
InsightReport PlaceholderReport(std::chrono::system_clock::time_point now);

/// @brief Holds the latest report; readers get the old or the new one whole
class LatestReportCell {
public:
    void Publish(std::shared_ptr<const InsightReport> report);

    /// @brief Current report, null before the first Publish()
    std::shared_ptr<const InsightReport> Get() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const InsightReport> report_;
};

}  // namespace supportpulse::insights
