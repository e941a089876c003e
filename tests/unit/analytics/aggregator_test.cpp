/// @file aggregator_test.cpp
/// @brief Tests for the time-bucketed analytics aggregator

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "analytics/aggregator.h"

namespace supportpulse::analytics {
namespace {

using std::chrono::seconds;
using std::chrono::system_clock;

inference::Prediction MakePrediction(system_clock::time_point timestamp,
                                     double confidence,
                                     Level satisfaction = Level::kMedium,
                                     Level priority = Level::kMedium,
                                     IssueType issue_type = IssueType::kGeneral) {
    inference::Prediction prediction;
    prediction.message = "message";
    prediction.issue_type = issue_type;
    prediction.predicted_satisfaction = satisfaction;
    prediction.recommended_priority = priority;
    prediction.confidence = confidence;
    prediction.timestamp = timestamp;
    return prediction;
}

class AggregatorTest : public ::testing::Test {
protected:
    // Aligned to a minute so bucket boundaries are predictable
    system_clock::time_point now_ = system_clock::time_point(seconds(1700000040));

    AnalyticsAggregator::Clock MakeClock() {
        return [this] { return now_; };
    }

    AggregatorConfig MakeConfig(int64_t width = 60, int64_t retention = 3600) {
        AggregatorConfig config;
        config.bucket_width = seconds(width);
        config.retention = seconds(retention);
        return config;
    }
};

TEST_F(AggregatorTest, EmptySnapshot) {
    AnalyticsAggregator aggregator(MakeConfig(), MakeClock());

    EXPECT_TRUE(aggregator.Snapshot().empty());
    EXPECT_EQ(aggregator.TotalRecorded(), 0);
}

TEST_F(AggregatorTest, RecordsIntoOneBucket) {
    AnalyticsAggregator aggregator(MakeConfig(), MakeClock());

    aggregator.Record(MakePrediction(now_, 0.2, Level::kLow, Level::kHigh,
                                     IssueType::kComplaint), 10.0);
    aggregator.Record(MakePrediction(now_ + seconds(5), 0.4, Level::kHigh, Level::kLow,
                                     IssueType::kCompliment), 20.0);
    aggregator.Record(MakePrediction(now_ + seconds(59), 0.9, Level::kLow, Level::kHigh,
                                     IssueType::kComplaint), 30.0);

    auto snapshot = aggregator.Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);

    const MetricBucket& bucket = snapshot[0];
    EXPECT_EQ(bucket.window_start, now_);
    EXPECT_EQ(bucket.count, 3);
    EXPECT_NEAR(bucket.avg_confidence, 0.5, 1e-9);
    EXPECT_NEAR(bucket.avg_latency_ms, 20.0, 1e-9);
    EXPECT_EQ(bucket.satisfaction_histogram[static_cast<size_t>(Level::kLow)], 2);
    EXPECT_EQ(bucket.satisfaction_histogram[static_cast<size_t>(Level::kHigh)], 1);
    EXPECT_EQ(bucket.priority_histogram[static_cast<size_t>(Level::kHigh)], 2);
    EXPECT_EQ(bucket.issue_type_histogram[static_cast<size_t>(IssueType::kComplaint)], 2);
    EXPECT_EQ(aggregator.TotalRecorded(), 3);
}

TEST_F(AggregatorTest, BucketsByTimestampInAscendingOrder) {
    AnalyticsAggregator aggregator(MakeConfig(), MakeClock());

    aggregator.Record(MakePrediction(now_ - seconds(30), 0.5), 1.0);
    aggregator.Record(MakePrediction(now_ - seconds(150), 0.5), 1.0);
    aggregator.Record(MakePrediction(now_ - seconds(90), 0.5), 1.0);

    auto snapshot = aggregator.Snapshot();
    ASSERT_EQ(snapshot.size(), 3u);
    EXPECT_EQ(snapshot[0].window_start, now_ - seconds(180));
    EXPECT_EQ(snapshot[1].window_start, now_ - seconds(120));
    EXPECT_EQ(snapshot[2].window_start, now_ - seconds(60));
}

TEST_F(AggregatorTest, AverageConfidenceIsArithmeticMean) {
    AnalyticsAggregator aggregator(MakeConfig(), MakeClock());
    const std::vector<double> confidences = {0.1, 0.25, 0.5, 0.75, 0.95, 0.3, 0.6};

    double sum = 0.0;
    for (double confidence : confidences) {
        aggregator.Record(MakePrediction(now_, confidence), 5.0);
        sum += confidence;
    }

    auto snapshot = aggregator.Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].count, static_cast<int64_t>(confidences.size()));
    EXPECT_NEAR(snapshot[0].avg_confidence, sum / confidences.size(), 1e-9);
}

TEST_F(AggregatorTest, EvictsBucketsPastRetention) {
    AnalyticsAggregator aggregator(MakeConfig(60, 120), MakeClock());

    aggregator.Record(MakePrediction(now_, 0.5), 1.0);
    ASSERT_EQ(aggregator.BucketCount(), 1u);

    now_ += seconds(200);
    EXPECT_TRUE(aggregator.Snapshot().empty());
    EXPECT_EQ(aggregator.BucketCount(), 0u);
    EXPECT_EQ(aggregator.TotalRecorded(), 1);
}

TEST_F(AggregatorTest, DropsEventsOlderThanRetention) {
    AnalyticsAggregator aggregator(MakeConfig(60, 600), MakeClock());

    aggregator.Record(MakePrediction(now_ - seconds(4000), 0.5), 1.0);

    EXPECT_EQ(aggregator.BucketCount(), 0u);
    EXPECT_EQ(aggregator.TotalRecorded(), 0);
}

TEST_F(AggregatorTest, RetentionShorterThanBucketIsWidened) {
    AnalyticsAggregator aggregator(MakeConfig(60, 0), MakeClock());
    EXPECT_EQ(aggregator.GetConfig().retention, seconds(3600));

    now_ += seconds(30);
    aggregator.Record(MakePrediction(now_, 0.5), 1.0);
    aggregator.Record(MakePrediction(now_ - seconds(20), 0.5), 1.0);

    auto snapshot = aggregator.Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].count, 2);
}

TEST_F(AggregatorTest, SnapshotWindow) {
    AnalyticsAggregator aggregator(MakeConfig(), MakeClock());

    aggregator.Record(MakePrediction(now_ - seconds(300), 0.5), 1.0);
    aggregator.Record(MakePrediction(now_ - seconds(30), 0.5), 1.0);

    EXPECT_EQ(aggregator.Snapshot().size(), 2u);

    auto recent = aggregator.Snapshot(seconds(60));
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].window_start, now_ - seconds(60));
}

TEST_F(AggregatorTest, ConcurrentRecordsAreAllCounted) {
    AnalyticsAggregator aggregator(MakeConfig(), MakeClock());
    constexpr int kThreads = 10;
    constexpr int kPerThread = 10;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&aggregator, this, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                const double confidence = (t * kPerThread + i) / 100.0;
                aggregator.Record(MakePrediction(now_ + seconds(i), confidence), 1.0);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto snapshot = aggregator.Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].count, kThreads * kPerThread);
    // Mean of 0.00 .. 0.99
    EXPECT_NEAR(snapshot[0].avg_confidence, 0.495, 1e-9);
    EXPECT_EQ(aggregator.TotalRecorded(), kThreads * kPerThread);
}

TEST_F(AggregatorTest, ResetKeepsTotal) {
    AnalyticsAggregator aggregator(MakeConfig(), MakeClock());
    aggregator.Record(MakePrediction(now_, 0.5), 1.0);

    aggregator.Reset();

    EXPECT_EQ(aggregator.BucketCount(), 0u);
    EXPECT_EQ(aggregator.TotalRecorded(), 1);
}

TEST_F(AggregatorTest, BucketJson) {
    AnalyticsAggregator aggregator(MakeConfig(), MakeClock());
    aggregator.Record(MakePrediction(now_, 0.5, Level::kLow, Level::kHigh,
                                     IssueType::kBilling), 12.0);

    auto json = ToJson(aggregator.Snapshot().at(0));
    EXPECT_EQ(json["window_start"], "2023-11-14T22:14:00.000Z");
    EXPECT_EQ(json["count"], 1);
    EXPECT_EQ(json["satisfaction_histogram"]["low"], 1);
    EXPECT_EQ(json["priority_histogram"]["high"], 1);
    EXPECT_EQ(json["issue_type_histogram"]["billing"], 1);
    EXPECT_EQ(json["issue_type_histogram"]["shipping"], 0);
}

TEST(AggregatorConfigTest, FromConfig) {
    auto config = Config::LoadFromString(R"(
analytics:
  bucket_width_seconds: 30
  retention_seconds: 10
)");
    ASSERT_TRUE(config.ok());

    auto result = AggregatorConfig::FromConfig(*config);
    EXPECT_EQ(result.bucket_width, seconds(30));
    // Retention never shorter than one bucket
    EXPECT_EQ(result.retention, seconds(3600));
}

}  // namespace
}  // namespace supportpulse::analytics
