#include "gateway/read_handlers.h"

#include <optional>

#include <absl/strings/numbers.h>

#include "analytics/summary.h"
#include "common/metrics.h"

namespace supportpulse::gateway {

using json = nlohmann::json;

namespace {

/// nullopt when absent; error response when present but not a positive integer
struct WindowParam {
    std::optional<std::chrono::seconds> window;
    std::optional<HttpResponse> error;
};

WindowParam ParseWindow(const HttpRequest& request) {
    WindowParam result;
    auto it = request.query_params.find("window_seconds");
    if (it == request.query_params.end()) {
        return result;
    }
    int64_t seconds = 0;
    if (!absl::SimpleAtoi(it->second, &seconds) || seconds <= 0) {
        result.error = HttpResponse::BadRequest(
            "invalid_window", "Query parameter 'window_seconds' must be a positive integer");
        return result;
    }
    result.window = std::chrono::seconds(seconds);
    return result;
}

}  // namespace

ReadHandlers::ReadHandlers(std::shared_ptr<analytics::AnalyticsAggregator> aggregator,
                           std::shared_ptr<insights::InsightsGenerator> generator,
                           std::shared_ptr<insights::InsightsScheduler> scheduler)
    : aggregator_(std::move(aggregator)),
      generator_(std::move(generator)),
      scheduler_(std::move(scheduler)) {}

HttpResponse ReadHandlers::HandleMetrics(const HttpRequest& request) const {
    auto window = ParseWindow(request);
    if (window.error) {
        return *window.error;
    }

    json buckets = json::array();
    for (const auto& bucket : aggregator_->Snapshot(window.window)) {
        buckets.push_back(analytics::ToJson(bucket));
    }

    const auto& config = aggregator_->GetConfig();
    return HttpResponse::Ok(json{
        {"bucket_width_seconds", config.bucket_width.count()},
        {"retention_seconds", config.retention.count()},
        {"total_recorded", aggregator_->TotalRecorded()},
        {"buckets", buckets},
    });
}

HttpResponse ReadHandlers::HandleSummary(const HttpRequest& request) const {
    auto window = ParseWindow(request);
    if (window.error) {
        return *window.error;
    }
    auto overview = analytics::Summarize(aggregator_->Snapshot(window.window));
    return HttpResponse::Ok(analytics::ToJson(overview));
}

HttpResponse ReadHandlers::HandleInternalMetrics(const HttpRequest& /*request*/) const {
    return HttpResponse::Text(MetricsRegistry::Instance().ExportText(),
                              "text/plain; version=0.0.4");
}

HttpResponse ReadHandlers::HandleInsights(const HttpRequest& /*request*/) const {
    auto report = generator_->Latest();
    if (report) {
        return HttpResponse::Ok(insights::ToJson(*report));
    }
    if (scheduler_) {
        scheduler_->Trigger();
    }
    return HttpResponse::Ok(
        insights::ToJson(insights::PlaceholderReport(std::chrono::system_clock::now())));
}

HttpResponse ReadHandlers::HandleGenerateInsights(const HttpRequest& /*request*/) const {
    auto report = generator_->Generate(aggregator_->Snapshot(generator_->GetConfig().window));
    return HttpResponse::Ok(insights::ToJson(*report));
}

}  // namespace supportpulse::gateway
