/// @file aggregator.cpp
/// @brief Analytics aggregator implementation

#include "analytics/aggregator.h"

#include <algorithm>

#include "common/logging.h"
#include "common/metrics.h"

namespace supportpulse::analytics {

using std::chrono::system_clock;

namespace {

int64_t ToSeconds(system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

int64_t FloorDiv(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

template <size_t N>
nlohmann::json LevelHistogram(const std::array<int64_t, N>& histogram) {
    nlohmann::json object = nlohmann::json::object();
    for (Level level : kAllLevels) {
        object[std::string(LevelName(level))] = histogram[static_cast<size_t>(level)];
    }
    return object;
}

}  // namespace

nlohmann::json ToJson(const MetricBucket& bucket) {
    nlohmann::json issues = nlohmann::json::object();
    for (IssueType type : kAllIssueTypes) {
        issues[std::string(IssueTypeName(type))] =
            bucket.issue_type_histogram[static_cast<size_t>(type)];
    }

    return nlohmann::json{
        {"window_start", FormatTimestamp(bucket.window_start)},
        {"count", bucket.count},
        {"satisfaction_histogram", LevelHistogram(bucket.satisfaction_histogram)},
        {"priority_histogram", LevelHistogram(bucket.priority_histogram)},
        {"issue_type_histogram", issues},
        {"avg_confidence", bucket.avg_confidence},
        {"avg_latency_ms", bucket.avg_latency_ms},
    };
}

AggregatorConfig AggregatorConfig::FromConfig(const Config& config) {
    AggregatorConfig result;
    const int64_t width = config.GetInt("analytics.bucket_width_seconds",
                                        result.bucket_width.count());
    const int64_t retention = config.GetInt("analytics.retention_seconds",
                                            result.retention.count());
    if (width > 0) {
        result.bucket_width = std::chrono::seconds(width);
    } else {
        SUPPORTPULSE_LOG_WARN("analytics.bucket_width_seconds must be positive, using {}",
                              result.bucket_width.count());
    }
    if (retention >= result.bucket_width.count()) {
        result.retention = std::chrono::seconds(retention);
    } else {
        SUPPORTPULSE_LOG_WARN("analytics.retention_seconds must cover one bucket, using {}",
                              std::max(result.retention, result.bucket_width).count());
        result.retention = std::max(result.retention, result.bucket_width);
    }
    return result;
}

AnalyticsAggregator::AnalyticsAggregator(AggregatorConfig config, Clock clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : Clock([] { return system_clock::now(); })) {
    if (config_.bucket_width.count() <= 0) {
        config_.bucket_width = std::chrono::seconds(60);
    }
    if (config_.retention < config_.bucket_width) {
        config_.retention = std::max(AggregatorConfig{}.retention, config_.bucket_width);
    }
}

int64_t AnalyticsAggregator::BucketKey(system_clock::time_point time) const {
    const int64_t width = config_.bucket_width.count();
    return FloorDiv(ToSeconds(time), width) * width;
}

std::shared_ptr<AnalyticsAggregator::BucketSlot> AnalyticsAggregator::FindOrCreate(int64_t key) {
    {
        std::shared_lock lock(index_mutex_);
        auto it = buckets_.find(key);
        if (it != buckets_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(index_mutex_);
    auto& slot = buckets_[key];
    if (!slot) {
        slot = std::make_shared<BucketSlot>();
        slot->bucket.window_start = system_clock::time_point(std::chrono::seconds(key));
        SUPPORTPULSE_GAUGE("analytics_buckets").Set(static_cast<double>(buckets_.size()));
    }
    return slot;
}

void AnalyticsAggregator::EvictExpired(system_clock::time_point now) {
    const int64_t horizon = ToSeconds(now) - config_.retention.count();

    {
        std::shared_lock lock(index_mutex_);
        if (buckets_.empty() || buckets_.begin()->first >= horizon) {
            return;
        }
    }

    std::unique_lock lock(index_mutex_);
    auto end = buckets_.lower_bound(horizon);
    const auto evicted = std::distance(buckets_.begin(), end);
    buckets_.erase(buckets_.begin(), end);
    SUPPORTPULSE_GAUGE("analytics_buckets").Set(static_cast<double>(buckets_.size()));
    if (evicted > 0) {
        SUPPORTPULSE_LOG_DEBUG("Evicted {} analytics bucket(s) past retention", evicted);
    }
}

void AnalyticsAggregator::Record(const inference::Prediction& prediction, double latency_ms) {
    const auto now = clock_();
    EvictExpired(now);

    const int64_t key = BucketKey(prediction.timestamp);
    if (key < ToSeconds(now) - config_.retention.count()) {
        SUPPORTPULSE_LOG_DEBUG("Dropping prediction older than the retention horizon");
        return;
    }

    auto slot = FindOrCreate(key);
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        MetricBucket& bucket = slot->bucket;

        ++bucket.count;
        ++bucket.satisfaction_histogram[static_cast<size_t>(prediction.predicted_satisfaction)];
        ++bucket.priority_histogram[static_cast<size_t>(prediction.recommended_priority)];
        ++bucket.issue_type_histogram[static_cast<size_t>(prediction.issue_type)];

        const double n = static_cast<double>(bucket.count);
        bucket.avg_confidence += (prediction.confidence - bucket.avg_confidence) / n;
        bucket.avg_latency_ms += (latency_ms - bucket.avg_latency_ms) / n;
    }

    total_recorded_.fetch_add(1, std::memory_order_acq_rel);
    SUPPORTPULSE_COUNTER("analytics_events_recorded_total").Increment();
}

std::vector<MetricBucket> AnalyticsAggregator::Snapshot(std::optional<std::chrono::seconds> window) {
    const auto now = clock_();
    EvictExpired(now);

    int64_t earliest = ToSeconds(now) - config_.retention.count();
    if (window.has_value()) {
        earliest = std::max(earliest, ToSeconds(now) - window->count());
    }

    std::vector<std::shared_ptr<BucketSlot>> slots;
    {
        std::shared_lock lock(index_mutex_);
        for (auto it = buckets_.lower_bound(earliest); it != buckets_.end(); ++it) {
            slots.push_back(it->second);
        }
    }

    std::vector<MetricBucket> snapshot;
    snapshot.reserve(slots.size());
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        snapshot.push_back(slot->bucket);
    }
    return snapshot;
}

void AnalyticsAggregator::Reset() {
    std::unique_lock lock(index_mutex_);
    buckets_.clear();
    SUPPORTPULSE_GAUGE("analytics_buckets").Set(0.0);
    SUPPORTPULSE_LOG_INFO("Analytics buckets cleared");
}

size_t AnalyticsAggregator::BucketCount() const {
    std::shared_lock lock(index_mutex_);
    return buckets_.size();
}

}  // namespace supportpulse::analytics
