#include "analytics/summary.h"

#include <algorithm>

#include <absl/strings/str_format.h>

namespace supportpulse::analytics {

double AnalyticsOverview::HighPriorityRate() const {
    return total > 0 ? 100.0 * static_cast<double>(high_priority) / static_cast<double>(total)
                     : 0.0;
}

double AnalyticsOverview::LowSatisfactionRate() const {
    return total > 0
               ? 100.0 * static_cast<double>(low_satisfaction) / static_cast<double>(total)
               : 0.0;
}

AnalyticsOverview Summarize(const std::vector<MetricBucket>& buckets) {
    AnalyticsOverview overview;
    overview.bucket_count = buckets.size();

    std::array<int64_t, 7> issues{};
    double confidence_sum = 0.0;
    double latency_sum = 0.0;

    for (const auto& bucket : buckets) {
        overview.total += bucket.count;
        for (size_t i = 0; i < 3; ++i) {
            overview.satisfaction_counts[i] += bucket.satisfaction_histogram[i];
            overview.priority_counts[i] += bucket.priority_histogram[i];
        }
        for (size_t i = 0; i < issues.size(); ++i) {
            issues[i] += bucket.issue_type_histogram[i];
        }
        confidence_sum += bucket.avg_confidence * static_cast<double>(bucket.count);
        latency_sum += bucket.avg_latency_ms * static_cast<double>(bucket.count);
    }

    overview.high_priority = overview.priority_counts[static_cast<size_t>(Level::kHigh)];
    overview.low_satisfaction = overview.satisfaction_counts[static_cast<size_t>(Level::kLow)];

    if (overview.total > 0) {
        overview.avg_confidence = confidence_sum / static_cast<double>(overview.total);
        overview.avg_latency_ms = latency_sum / static_cast<double>(overview.total);
    }

    for (IssueType type : kAllIssueTypes) {
        const int64_t count = issues[static_cast<size_t>(type)];
        if (count > 0) {
            overview.issue_distribution.emplace_back(type, count);
        }
    }
    // Stable: equal counts keep enum order
    std::stable_sort(overview.issue_distribution.begin(), overview.issue_distribution.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (!overview.issue_distribution.empty()) {
        overview.top_issue = overview.issue_distribution.front().first;
    }

    overview.severity = ComputeSeverity(overview);
    return overview;
}

Level ComputeSeverity(const AnalyticsOverview& overview) {
    if (overview.total == 0) {
        return Level::kLow;
    }
    const double high_priority = overview.HighPriorityRate();
    const double low_satisfaction = overview.LowSatisfactionRate();

    if (high_priority > 40.0 || low_satisfaction > 50.0) {
        return Level::kHigh;
    }
    if (high_priority > 20.0 || low_satisfaction > 30.0) {
        return Level::kMedium;
    }
    return Level::kLow;
}

std::vector<std::string> RuleBasedAlerts(const AnalyticsOverview& overview) {
    std::vector<std::string> alerts;
    if (overview.total == 0) {
        return alerts;
    }
    if (overview.HighPriorityRate() > 30.0) {
        alerts.push_back(absl::StrFormat(
            "High priority issue spike: %.1f%% of cases need urgent attention",
            overview.HighPriorityRate()));
    }
    if (overview.LowSatisfactionRate() > 40.0) {
        alerts.push_back(absl::StrFormat(
            "Customer satisfaction concern: %.1f%% of cases predicted low satisfaction",
            overview.LowSatisfactionRate()));
    }
    return alerts;
}

nlohmann::json ToJson(const AnalyticsOverview& overview) {
    nlohmann::json distribution = nlohmann::json::array();
    for (const auto& [type, count] : overview.issue_distribution) {
        distribution.push_back({{"issue_type", IssueTypeName(type)}, {"count", count}});
    }

    nlohmann::json satisfaction = nlohmann::json::object();
    nlohmann::json priority = nlohmann::json::object();
    for (Level level : kAllLevels) {
        satisfaction[std::string(LevelName(level))] =
            overview.satisfaction_counts[static_cast<size_t>(level)];
        priority[std::string(LevelName(level))] =
            overview.priority_counts[static_cast<size_t>(level)];
    }

    return nlohmann::json{
        {"total_predictions", overview.total},
        {"high_priority", overview.high_priority},
        {"low_satisfaction", overview.low_satisfaction},
        {"high_priority_rate", overview.HighPriorityRate()},
        {"low_satisfaction_rate", overview.LowSatisfactionRate()},
        {"satisfaction_distribution", satisfaction},
        {"priority_distribution", priority},
        {"avg_confidence", overview.avg_confidence},
        {"avg_latency_ms", overview.avg_latency_ms},
        {"issue_distribution", distribution},
        {"top_issue_type", overview.top_issue ? nlohmann::json(IssueTypeName(*overview.top_issue))
                                              : nlohmann::json(nullptr)},
        {"bucket_count", overview.bucket_count},
        {"severity", LevelName(overview.severity)},
    };
}

}  // namespace supportpulse::analytics
