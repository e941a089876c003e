/// @file analytics_sink_test.cpp
/// @brief Tests for asynchronous delivery of prediction events

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>

#include "analytics/analytics_sink.h"
#include "common/error.h"

namespace supportpulse::analytics {
namespace {

inference::Prediction MakePrediction(std::chrono::system_clock::time_point timestamp) {
    inference::Prediction prediction;
    prediction.message = "hello";
    prediction.confidence = 0.5;
    prediction.timestamp = timestamp;
    return prediction;
}

TEST(AnalyticsSinkTest, DeliversEveryAcceptedEvent) {
    auto aggregator = std::make_shared<AnalyticsAggregator>();
    AsyncAnalyticsSink sink(aggregator, 2);

    const auto now = std::chrono::system_clock::now();
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(sink.Submit(MakePrediction(now), 1.0).ok());
    }
    sink.Flush();

    EXPECT_EQ(aggregator->TotalRecorded(), 50);
    EXPECT_EQ(sink.Pending(), 0u);
}

TEST(AnalyticsSinkTest, StoppedSinkRejects) {
    auto aggregator = std::make_shared<AnalyticsAggregator>();
    AsyncAnalyticsSink sink(aggregator);
    sink.Shutdown();

    auto status = sink.Submit(MakePrediction(std::chrono::system_clock::now()), 1.0);
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kAggregatorUnavailable);
}

TEST(AnalyticsSinkTest, FullQueueRejectsWithoutBlocking) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> blocked{false};
    const auto now = std::chrono::system_clock::now();

    // The aggregator reads the clock first thing in Record(), which lets the
    // test park the only worker
    auto aggregator = std::make_shared<AnalyticsAggregator>(
        AggregatorConfig{}, [gate, &blocked, now]() {
            blocked.store(true);
            gate.wait();
            return now;
        });
    AsyncAnalyticsSink sink(aggregator, 1, 1);

    ASSERT_TRUE(sink.Submit(MakePrediction(now), 1.0).ok());
    while (!blocked.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_TRUE(sink.Submit(MakePrediction(now), 1.0).ok());

    auto status = sink.Submit(MakePrediction(now), 1.0);
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kAggregatorUnavailable);

    release.set_value();
    sink.Flush();
    EXPECT_EQ(aggregator->TotalRecorded(), 2);
}

}  // namespace
}  // namespace supportpulse::analytics
