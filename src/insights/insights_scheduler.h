#pragma once

/// @file insights_scheduler.h
/// @brief Recurring background insight generation

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "analytics/aggregator.h"
#include "insights/insights_generator.h"

namespace supportpulse::insights {

/// @brief Regenerates the insight report on a fixed interval
///
/// A cycle runs when at least `min_new_predictions` events were recorded
/// since the previous cycle, when no report exists yet, or when forced by
/// Trigger(). Stop() interrupts the wait immediately.
class InsightsScheduler {
public:
    InsightsScheduler(std::shared_ptr<InsightsGenerator> generator,
                      std::shared_ptr<analytics::AnalyticsAggregator> aggregator);
    ~InsightsScheduler();

    InsightsScheduler(const InsightsScheduler&) = delete;
    InsightsScheduler& operator=(const InsightsScheduler&) = delete;

    void Start();
    void Stop();

    /// @brief Wake the loop and force a cycle
    void Trigger();

    /// @brief Run one cycle on the calling thread
    /// @param force Regenerate regardless of the refresh policy
    /// @return true if a report was generated
    bool RunOnce(bool force = false);

    bool IsRunning() const { return running_.load(); }

    int64_t CyclesRun() const { return cycles_.load(); }

private:
    void Loop();

    std::shared_ptr<InsightsGenerator> generator_;
    std::shared_ptr<analytics::AnalyticsAggregator> aggregator_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    bool trigger_requested_ = false;

    std::mutex cycle_mutex_;
    int64_t last_seen_total_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<int64_t> cycles_{0};
    std::thread thread_;
};

}  // namespace supportpulse::insights
