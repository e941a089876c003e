/// @file summary_test.cpp
/// @brief Tests for snapshot summaries, severity and rule-based alerts

#include <gtest/gtest.h>

#include "analytics/summary.h"

namespace supportpulse::analytics {
namespace {

/// Bucket with `count` events of which `high` are high priority and `low`
/// are low satisfaction; the rest are medium
MetricBucket MakeBucket(int64_t count, int64_t high, int64_t low, double avg_confidence,
                        IssueType issue_type = IssueType::kGeneral) {
    MetricBucket bucket;
    bucket.count = count;
    bucket.priority_histogram[static_cast<size_t>(Level::kHigh)] = high;
    bucket.priority_histogram[static_cast<size_t>(Level::kMedium)] = count - high;
    bucket.satisfaction_histogram[static_cast<size_t>(Level::kLow)] = low;
    bucket.satisfaction_histogram[static_cast<size_t>(Level::kMedium)] = count - low;
    bucket.issue_type_histogram[static_cast<size_t>(issue_type)] = count;
    bucket.avg_confidence = avg_confidence;
    bucket.avg_latency_ms = 10.0;
    return bucket;
}

TEST(SummaryTest, EmptySnapshot) {
    auto overview = Summarize({});

    EXPECT_EQ(overview.total, 0);
    EXPECT_DOUBLE_EQ(overview.HighPriorityRate(), 0.0);
    EXPECT_FALSE(overview.top_issue.has_value());
    EXPECT_EQ(overview.severity, Level::kLow);
    EXPECT_TRUE(RuleBasedAlerts(overview).empty());
}

TEST(SummaryTest, WeightsAveragesByCount) {
    auto overview = Summarize({
        MakeBucket(1, 0, 0, 1.0),
        MakeBucket(3, 0, 0, 0.2),
    });

    EXPECT_EQ(overview.total, 4);
    EXPECT_EQ(overview.bucket_count, 2u);
    EXPECT_NEAR(overview.avg_confidence, 0.4, 1e-9);
    EXPECT_NEAR(overview.avg_latency_ms, 10.0, 1e-9);
}

TEST(SummaryTest, IssueDistributionMostFrequentFirst) {
    auto overview = Summarize({
        MakeBucket(2, 0, 0, 0.5, IssueType::kShipping),
        MakeBucket(5, 0, 0, 0.5, IssueType::kBilling),
        MakeBucket(2, 0, 0, 0.5, IssueType::kAccountAccess),
    });

    ASSERT_EQ(overview.issue_distribution.size(), 3u);
    EXPECT_EQ(overview.issue_distribution[0].first, IssueType::kBilling);
    // Ties keep declaration order
    EXPECT_EQ(overview.issue_distribution[1].first, IssueType::kAccountAccess);
    EXPECT_EQ(overview.issue_distribution[2].first, IssueType::kShipping);
    EXPECT_EQ(overview.top_issue, IssueType::kBilling);
}

TEST(SummaryTest, SeverityThresholds) {
    EXPECT_EQ(Summarize({MakeBucket(10, 5, 0, 0.5)}).severity, Level::kHigh);
    EXPECT_EQ(Summarize({MakeBucket(10, 0, 6, 0.5)}).severity, Level::kHigh);
    EXPECT_EQ(Summarize({MakeBucket(10, 3, 0, 0.5)}).severity, Level::kMedium);
    EXPECT_EQ(Summarize({MakeBucket(10, 0, 4, 0.5)}).severity, Level::kMedium);
    EXPECT_EQ(Summarize({MakeBucket(10, 2, 3, 0.5)}).severity, Level::kLow);
}

TEST(SummaryTest, RuleBasedAlerts) {
    auto overview = Summarize({MakeBucket(10, 4, 5, 0.5)});

    auto alerts = RuleBasedAlerts(overview);
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0], "High priority issue spike: 40.0% of cases need urgent attention");
    EXPECT_EQ(alerts[1],
              "Customer satisfaction concern: 50.0% of cases predicted low satisfaction");
}

TEST(SummaryTest, OverviewJson) {
    auto overview = Summarize({MakeBucket(4, 1, 2, 0.5, IssueType::kComplaint)});

    auto json = ToJson(overview);
    EXPECT_EQ(json["total_predictions"], 4);
    EXPECT_DOUBLE_EQ(json["high_priority_rate"].get<double>(), 25.0);
    EXPECT_DOUBLE_EQ(json["low_satisfaction_rate"].get<double>(), 50.0);
    EXPECT_EQ(json["top_issue_type"], "complaint");
    EXPECT_EQ(json["severity"], "medium");
    EXPECT_EQ(json["priority_distribution"]["high"], 1);
    ASSERT_EQ(json["issue_distribution"].size(), 1u);
    EXPECT_EQ(json["issue_distribution"][0]["count"], 4);
}

TEST(SummaryTest, NoDataJsonHasNullTopIssue) {
    auto json = ToJson(Summarize({}));
    EXPECT_TRUE(json["top_issue_type"].is_null());
    EXPECT_EQ(json["severity"], "low");
}

}  // namespace
}  // namespace supportpulse::analytics
