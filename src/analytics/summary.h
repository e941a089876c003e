#pragma once

/// @file summary.h
/// @brief Folding a bucket snapshot into an overview with rule-based findings

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/aggregator.h"

namespace supportpulse::analytics {

/// @brief Totals over a snapshot
struct AnalyticsOverview {
    int64_t total = 0;
    int64_t high_priority = 0;
    int64_t low_satisfaction = 0;
    std::array<int64_t, 3> satisfaction_counts{};
    std::array<int64_t, 3> priority_counts{};

    /// Count-weighted means over all buckets
    double avg_confidence = 0.0;
    double avg_latency_ms = 0.0;

    /// Non-zero issue types, most frequent first
    std::vector<std::pair<IssueType, int64_t>> issue_distribution;
    std::optional<IssueType> top_issue;

    size_t bucket_count = 0;
    Level severity = Level::kLow;

    /// Percentages, 0 when there is no data
    double HighPriorityRate() const;
    double LowSatisfactionRate() const;
};

AnalyticsOverview Summarize(const std::vector<MetricBucket>& buckets);

/// @brief high if high-priority > 40% or low-satisfaction > 50%,
///        medium if > 20% or > 30%, low otherwise
Level ComputeSeverity(const AnalyticsOverview& overview);

/// @brief Threshold alerts: high-priority > 30%, low-satisfaction > 40%
std::vector<std::string> RuleBasedAlerts(const AnalyticsOverview& overview);

nlohmann::json ToJson(const AnalyticsOverview& overview);

}  // namespace supportpulse::analytics
