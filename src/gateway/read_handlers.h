#pragma once

/// @file read_handlers.h
/// @brief Read APIs over analytics and insights

#include <memory>

#include "analytics/aggregator.h"
#include "gateway/http_types.h"
#include "insights/insights_generator.h"
#include "insights/insights_scheduler.h"

namespace supportpulse::gateway {

/// @brief GET /metrics, /metrics/internal, /api/analytics/summary and the
///        insight endpoints
class ReadHandlers {
public:
    /// @param scheduler May be null; placeholder reads then cannot trigger a cycle
    ReadHandlers(std::shared_ptr<analytics::AnalyticsAggregator> aggregator,
                 std::shared_ptr<insights::InsightsGenerator> generator,
                 std::shared_ptr<insights::InsightsScheduler> scheduler);

    /// Optional `window_seconds` query parameter
    HttpResponse HandleMetrics(const HttpRequest& request) const;
    HttpResponse HandleSummary(const HttpRequest& request) const;

    HttpResponse HandleInternalMetrics(const HttpRequest& request) const;

    /// Latest report, or a placeholder while the first one is generated
    HttpResponse HandleInsights(const HttpRequest& request) const;

    /// Synchronous generation cycle
    HttpResponse HandleGenerateInsights(const HttpRequest& request) const;

private:
    std::shared_ptr<analytics::AnalyticsAggregator> aggregator_;
    std::shared_ptr<insights::InsightsGenerator> generator_;
    std::shared_ptr<insights::InsightsScheduler> scheduler_;
};

}  // namespace supportpulse::gateway
