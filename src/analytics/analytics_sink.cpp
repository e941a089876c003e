#include "analytics/analytics_sink.h"

#include "common/error.h"
#include "common/metrics.h"

namespace supportpulse::analytics {

AsyncAnalyticsSink::AsyncAnalyticsSink(std::shared_ptr<AnalyticsAggregator> aggregator,
                                       size_t num_threads,
                                       size_t max_queue)
    : aggregator_(std::move(aggregator)),
      pool_(num_threads == 0 ? 1 : num_threads, max_queue) {}

AsyncAnalyticsSink::~AsyncAnalyticsSink() {
    Shutdown();
}

absl::Status AsyncAnalyticsSink::Submit(const inference::Prediction& prediction,
                                        double latency_ms) {
    auto aggregator = aggregator_;
    const bool accepted = pool_.TryExecute([aggregator, prediction, latency_ms]() {
        aggregator->Record(prediction, latency_ms);
    });

    if (!accepted) {
        SUPPORTPULSE_COUNTER("analytics_events_dropped_total").Increment();
        return AggregatorUnavailableError(
            pool_.IsStopped() ? "Analytics sink is stopped" : "Analytics queue is full");
    }
    return absl::OkStatus();
}

void AsyncAnalyticsSink::Flush() {
    pool_.Wait();
}

void AsyncAnalyticsSink::Shutdown() {
    pool_.Shutdown();
}

}  // namespace supportpulse::analytics
