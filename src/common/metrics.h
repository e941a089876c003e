#pragma once

/// @file metrics.h
/// @brief SupportPulse internal metrics for self-monitoring
///
/// These are process counters about the service itself (request counts,
/// latencies, dropped events). Business analytics over predictions live in
/// analytics/aggregator.h.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace supportpulse {

/// @brief Monotonic counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    void Increment();

    /// @brief Add a non-negative amount; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief Gauge that can go up and down
class Gauge {
public:
    explicit Gauge(std::string name, std::string description = "");

    void Set(double value);
    void Increment(double delta = 1.0);
    void Decrement(double delta = 1.0);
    double Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<double> value_{0.0};
};

/// @brief Cumulative histogram with fixed upper bounds (seconds by default)
class Histogram {
public:
    explicit Histogram(std::string name, std::string description = "");
    Histogram(std::string name, std::vector<double> bounds, std::string description = "");

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative (upper bound, count) pairs, ending with +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bounds_;
    std::unique_ptr<std::atomic<int64_t>[]> bucket_counts_;  // bounds_.size() + 1 slots
    std::atomic<int64_t> count_{0};
    std::atomic<double> sum_{0.0};
};

/// @brief RAII timer observing its lifetime in seconds
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    /// @brief Elapsed time so far
    std::chrono::steady_clock::duration Elapsed() const;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Process-wide registry of named metrics
///
/// References returned by the getters stay valid until Reset(); callers
/// should look metrics up per use rather than caching them in statics.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    Counter& GetCounter(const std::string& name, const std::string& description = "");
    Gauge& GetGauge(const std::string& name, const std::string& description = "");
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Prometheus text exposition of every registered metric
    std::string ExportText() const;

    /// @brief Drop all metrics (tests only)
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Counter>> counters_;
    std::unordered_map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::unordered_map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define SUPPORTPULSE_COUNTER(name) \
    ::supportpulse::MetricsRegistry::Instance().GetCounter(name)

#define SUPPORTPULSE_GAUGE(name) \
    ::supportpulse::MetricsRegistry::Instance().GetGauge(name)

#define SUPPORTPULSE_HISTOGRAM(name) \
    ::supportpulse::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace supportpulse
