#pragma once

/// @file aggregator.h
/// @brief Rolling time-bucketed metrics over prediction events

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/types.h"
#include "inference/types.h"

namespace supportpulse::analytics {

/// @brief Aggregated metrics of one fixed-width time window
struct MetricBucket {
    std::chrono::system_clock::time_point window_start;
    int64_t count = 0;
    std::array<int64_t, 3> satisfaction_histogram{};  ///< indexed by Level
    std::array<int64_t, 3> priority_histogram{};      ///< indexed by Level
    std::array<int64_t, 7> issue_type_histogram{};    ///< indexed by IssueType
    double avg_confidence = 0.0;
    double avg_latency_ms = 0.0;
};

nlohmann::json ToJson(const MetricBucket& bucket);

/// @brief Aggregator configuration
struct AggregatorConfig {
    std::chrono::seconds bucket_width{60};
    std::chrono::seconds retention{3600};

    /// Read the `analytics.*` section
    static AggregatorConfig FromConfig(const Config& config);
};

/// @brief In-memory store of MetricBuckets
///
/// Writers lock only the bucket they update. The bucket index is guarded by
/// a reader/writer lock that is taken exclusively only to insert or evict a
/// bucket. Buckets older than the retention horizon are evicted lazily on
/// Record() and Snapshot().
class AnalyticsAggregator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit AnalyticsAggregator(AggregatorConfig config = {}, Clock clock = nullptr);

    AnalyticsAggregator(const AnalyticsAggregator&) = delete;
    AnalyticsAggregator& operator=(const AnalyticsAggregator&) = delete;

    /// @brief Add a prediction to the bucket of its timestamp
    void Record(const inference::Prediction& prediction, double latency_ms);

    /// @brief Copy of the retained buckets in ascending window_start order
    /// @param window Only buckets starting within this much of now
    std::vector<MetricBucket> Snapshot(
        std::optional<std::chrono::seconds> window = std::nullopt);

    /// @brief Drop every bucket
    void Reset();

    /// @brief Events recorded since start, never decreases
    int64_t TotalRecorded() const { return total_recorded_.load(std::memory_order_acquire); }

    size_t BucketCount() const;

    const AggregatorConfig& GetConfig() const { return config_; }

private:
    struct BucketSlot {
        std::mutex mutex;
        MetricBucket bucket;
    };

    int64_t BucketKey(std::chrono::system_clock::time_point time) const;
    std::shared_ptr<BucketSlot> FindOrCreate(int64_t key);
    void EvictExpired(std::chrono::system_clock::time_point now);

    AggregatorConfig config_;
    Clock clock_;

    mutable std::shared_mutex index_mutex_;
    std::map<int64_t, std::shared_ptr<BucketSlot>> buckets_;  ///< key: window start, seconds

    std::atomic<int64_t> total_recorded_{0};
};

}  // namespace supportpulse::analytics
