#include "metrics.h"

#include <algorithm>
#include <limits>
#include <map>
#include <sstream>

namespace supportpulse {

namespace {

// Request latencies, in seconds
const std::vector<double> kDefaultBounds = {
    0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 5.0
};

void AtomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(current, current + delta,
                                         std::memory_order_relaxed)) {
    }
}

template <typename Map>
auto SortedView(const Map& metrics) {
    std::map<std::string, const typename Map::mapped_type::element_type*> sorted;
    for (const auto& [name, metric] : metrics) {
        sorted.emplace(name, metric.get());
    }
    return sorted;
}

}  // namespace

Counter::Counter(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta >= 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Gauge::Gauge(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Gauge::Set(double value) {
    value_.store(value, std::memory_order_relaxed);
}

void Gauge::Increment(double delta) {
    AtomicAdd(value_, delta);
}

void Gauge::Decrement(double delta) {
    AtomicAdd(value_, -delta);
}

double Gauge::Value() const {
    return value_.load(std::memory_order_relaxed);
}

Histogram::Histogram(std::string name, std::string description)
    : Histogram(std::move(name), kDefaultBounds, std::move(description)) {}

Histogram::Histogram(std::string name, std::vector<double> bounds, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    bucket_counts_ = std::make_unique<std::atomic<int64_t>[]>(bounds_.size() + 1);
    for (size_t i = 0; i <= bounds_.size(); ++i) {
        bucket_counts_[i].store(0, std::memory_order_relaxed);
    }
}

void Histogram::Observe(double value) {
    count_.fetch_add(1, std::memory_order_relaxed);
    AtomicAdd(sum_, value);

    // First bound >= value; values above every bound land in the +Inf slot
    auto it = std::lower_bound(bounds_.begin(), bounds_.end(), value);
    const auto slot = static_cast<size_t>(std::distance(bounds_.begin(), it));
    bucket_counts_[slot].fetch_add(1, std::memory_order_relaxed);
}

int64_t Histogram::Count() const {
    return count_.load(std::memory_order_relaxed);
}

double Histogram::Sum() const {
    return sum_.load(std::memory_order_relaxed);
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(bounds_.size() + 1);

    int64_t cumulative = 0;
    for (size_t i = 0; i < bounds_.size(); ++i) {
        cumulative += bucket_counts_[i].load(std::memory_order_relaxed);
        result.emplace_back(bounds_[i], cumulative);
    }
    cumulative += bucket_counts_[bounds_.size()].load(std::memory_order_relaxed);
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);
    return result;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> seconds = Elapsed();
    histogram_.Observe(seconds.count());
}

std::chrono::steady_clock::duration ScopedTimer::Elapsed() const {
    return std::chrono::steady_clock::now() - start_;
}

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) {
        slot = std::make_unique<Counter>(name, description);
    }
    return *slot;
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) {
        slot = std::make_unique<Gauge>(name, description);
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) {
        slot = std::make_unique<Histogram>(name, description);
    }
    return *slot;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [name, counter] : SortedView(counters_)) {
        if (!counter->Description().empty()) {
            oss << "# HELP " << name << " " << counter->Description() << "\n";
        }
        oss << "# TYPE " << name << " counter\n";
        oss << name << " " << counter->Value() << "\n";
    }

    for (const auto& [name, gauge] : SortedView(gauges_)) {
        if (!gauge->Description().empty()) {
            oss << "# HELP " << name << " " << gauge->Description() << "\n";
        }
        oss << "# TYPE " << name << " gauge\n";
        oss << name << " " << gauge->Value() << "\n";
    }

    for (const auto& [name, histogram] : SortedView(histograms_)) {
        if (!histogram->Description().empty()) {
            oss << "# HELP " << name << " " << histogram->Description() << "\n";
        }
        oss << "# TYPE " << name << " histogram\n";
        for (const auto& [bound, count] : histogram->Buckets()) {
            oss << name << "_bucket{le=\"";
            if (bound == std::numeric_limits<double>::infinity()) {
                oss << "+Inf";
            } else {
                oss << bound;
            }
            oss << "\"} " << count << "\n";
        }
        oss << name << "_sum " << histogram->Sum() << "\n";
        oss << name << "_count " << histogram->Count() << "\n";
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
}

}  // namespace supportpulse
