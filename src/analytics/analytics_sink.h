#pragma once

/// @file analytics_sink.h
/// @brief Fire-and-forget delivery of prediction events to the aggregator

#include <cstddef>
#include <memory>

#include <absl/status/status.h>

#include "analytics/aggregator.h"
#include "common/thread_pool.h"
#include "inference/types.h"

namespace supportpulse::analytics {

/// @brief Receiver of prediction events
class AnalyticsSink {
public:
    virtual ~AnalyticsSink() = default;

    /// @brief Hand over an event; must not block on aggregation
    /// @return AggregatorUnavailable if the event cannot be accepted
    virtual absl::Status Submit(const inference::Prediction& prediction, double latency_ms) = 0;
};

/// @brief Sink that records on a small worker pool with a bounded queue
class AsyncAnalyticsSink : public AnalyticsSink {
public:
    AsyncAnalyticsSink(std::shared_ptr<AnalyticsAggregator> aggregator,
                       size_t num_threads = 1,
                       size_t max_queue = 10000);
    ~AsyncAnalyticsSink() override;

    absl::Status Submit(const inference::Prediction& prediction, double latency_ms) override;

    /// @brief Wait until every accepted event has been recorded
    void Flush();

    /// @brief Drain accepted events and reject new ones
    void Shutdown();

    size_t Pending() const { return pool_.PendingTasks(); }

private:
    std::shared_ptr<AnalyticsAggregator> aggregator_;
    ThreadPool pool_;
};

}  // namespace supportpulse::analytics
