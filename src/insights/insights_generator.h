#pragma once

/// @file insights_generator.h
/// @brief Turns metric snapshots into narrative insight reports

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "analytics/aggregator.h"
#include "analytics/summary.h"
#include "common/config.h"
#include "common/thread_pool.h"
#include "insights/ollama_generator.h"
#include "insights/report.h"
#include "insights/text_generator.h"

namespace supportpulse::insights {

/// @brief Insights configuration (`insights.*`)
struct InsightsConfig {
    /// When false no backend is called and reports are rule based
    bool enabled = true;

    OllamaConfig backend;

    /// Deadline of one backend call, on top of the backend's own timeouts
    std::chrono::milliseconds timeout{5000};
    size_t max_prompt_chars = 4000;

    std::chrono::seconds interval{10};
    int64_t min_new_predictions = 5;

    /// Snapshot window; unset uses the whole retention
    std::optional<std::chrono::seconds> window;

    static InsightsConfig FromConfig(const Config& config);
};

/// @brief Generation statistics
struct InsightsStats {
    int64_t generations = 0;
    int64_t backend_calls = 0;
    int64_t degraded = 0;
};

/// @brief Builds reports and publishes them to a LatestReportCell
///
/// Generate() never throws and never blocks longer than the configured
/// timeout plus prompt formatting. A failed or late backend call yields the
/// previous report marked degraded, or a degraded rule-based report when
/// there is no previous one. Concurrent Generate() calls are serialized.
class InsightsGenerator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// @param backend Text generator; null behaves like `enabled: false`
    InsightsGenerator(std::shared_ptr<TextGenerator> backend,
                      InsightsConfig config = {},
                      Clock clock = nullptr);
    ~InsightsGenerator();

    InsightsGenerator(const InsightsGenerator&) = delete;
    InsightsGenerator& operator=(const InsightsGenerator&) = delete;

    /// @brief Summarize a snapshot, publish and return the report
    std::shared_ptr<const InsightReport> Generate(
        const std::vector<analytics::MetricBucket>& snapshot);

    /// @brief Bounded prompt describing an overview
    std::string BuildPrompt(const analytics::AnalyticsOverview& overview) const;

    /// @brief Latest published report, null before the first generation
    std::shared_ptr<const InsightReport> Latest() const { return latest_.Get(); }

    InsightsStats GetStats() const;

    const InsightsConfig& GetConfig() const { return config_; }

private:
    InsightReport NoDataReport(const analytics::AnalyticsOverview& overview) const;
    InsightReport RuleBasedReport(const analytics::AnalyticsOverview& overview) const;
    absl::StatusOr<std::string> CallBackend(const std::string& prompt);
    std::shared_ptr<const InsightReport> Publish(InsightReport report);

    std::shared_ptr<TextGenerator> backend_;
    InsightsConfig config_;
    Clock clock_;

    std::mutex generate_mutex_;
    LatestReportCell latest_;

    mutable std::mutex stats_mutex_;
    InsightsStats stats_;

    // Declared last so in-flight backend calls finish before members go away
    ThreadPool pool_;
};

/// @brief Create the configured backend, null when insights are disabled
std::shared_ptr<TextGenerator> CreateTextGenerator(const InsightsConfig& config);

}  // namespace supportpulse::insights
