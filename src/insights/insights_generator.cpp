/// @file insights_generator.cpp
/// @brief Insight generation with backend timeout and degraded fallbacks

#include "insights/insights_generator.h"

#include <future>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace supportpulse::insights {

using analytics::AnalyticsOverview;

namespace {

constexpr char kDefaultTitle[] = "Customer Service Analytics Summary";

constexpr char kResponseFormat[] = R"(
Provide a business insight in this EXACT format:

{
  "title": "Customer Service Analytics Summary",
  "overview": "Brief 2-sentence overview of current situation",
  "key_findings": ["Finding with specific data", "..."],
  "alerts": ["Critical issues requiring immediate attention"],
  "recommendations": ["Specific actionable recommendation", "..."],
  "trends": "Description of patterns observed across the data"
}

Focus on actionable insights, specific data points and business impact. Respond ONLY with valid JSON.
)";

std::string Percent(double value) {
    return absl::StrFormat("%.1f%%", value);
}

}  // namespace

InsightsConfig InsightsConfig::FromConfig(const Config& config) {
    InsightsConfig result;
    result.enabled = config.GetBool("insights.enabled", result.enabled);

    auto& backend = result.backend;
    backend.base_url = config.GetString("insights.backend_url", backend.base_url);
    backend.model = config.GetString("insights.model", backend.model);
    backend.temperature = config.GetDouble("insights.temperature", backend.temperature);
    backend.num_predict = static_cast<int>(
        config.GetInt("insights.num_predict", backend.num_predict));

    const int64_t timeout_ms = config.GetInt("insights.timeout_ms", result.timeout.count());
    if (timeout_ms > 0) {
        result.timeout = std::chrono::milliseconds(timeout_ms);
    }
    backend.timeout = result.timeout;

    const int64_t max_prompt = config.GetInt("insights.max_prompt_chars",
                                             static_cast<int64_t>(result.max_prompt_chars));
    if (max_prompt > 0) {
        result.max_prompt_chars = static_cast<size_t>(max_prompt);
    }

    const int64_t interval = config.GetInt("insights.interval_seconds", result.interval.count());
    if (interval > 0) {
        result.interval = std::chrono::seconds(interval);
    }
    result.min_new_predictions =
        config.GetInt("insights.min_new_predictions", result.min_new_predictions);

    const int64_t window = config.GetInt("insights.window_seconds", 0);
    if (window > 0) {
        result.window = std::chrono::seconds(window);
    }
    return result;
}

std::shared_ptr<TextGenerator> CreateTextGenerator(const InsightsConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    return std::make_shared<OllamaTextGenerator>(config.backend);
}

// =============================================================================
// InsightsGenerator
// =============================================================================

InsightsGenerator::InsightsGenerator(std::shared_ptr<TextGenerator> backend,
                                     InsightsConfig config,
                                     Clock clock)
    : backend_(config.enabled ? std::move(backend) : nullptr),
      config_(std::move(config)),
      clock_(clock ? std::move(clock)
                   : Clock([] { return std::chrono::system_clock::now(); })),
      pool_(2) {}

InsightsGenerator::~InsightsGenerator() = default;

std::string InsightsGenerator::BuildPrompt(const AnalyticsOverview& overview) const {
    std::string data = absl::StrCat(
        "You are an expert customer service analyst. Analyze the data below and provide "
        "a single business intelligence summary.\n\n",
        "OVERALL METRICS:\n",
        "- Total predictions analyzed: ", overview.total, "\n",
        "- High priority cases: ", overview.high_priority, " (",
        Percent(overview.HighPriorityRate()), ")\n",
        "- Predicted low satisfaction: ", overview.low_satisfaction, " (",
        Percent(overview.LowSatisfactionRate()), ")\n",
        "- Average confidence: ", absl::StrFormat("%.2f", overview.avg_confidence), "\n",
        "- Average response time: ", absl::StrFormat("%.1f", overview.avg_latency_ms), "ms\n",
        "- Time buckets covered: ", overview.bucket_count, "\n\n");

    absl::StrAppend(&data, "TOP ISSUE TYPES:\n");
    if (overview.issue_distribution.empty()) {
        absl::StrAppend(&data, "No issue data available\n");
    }
    size_t listed = 0;
    for (const auto& [type, count] : overview.issue_distribution) {
        if (listed++ == 3) {
            break;
        }
        absl::StrAppend(&data, "- ", IssueTypeName(type), ": ", count, " cases\n");
    }

    absl::StrAppend(&data, "\nSATISFACTION BREAKDOWN:\n");
    for (Level level : kAllLevels) {
        absl::StrAppend(&data, "- ", LevelName(level), ": ",
                        overview.satisfaction_counts[static_cast<size_t>(level)], " cases\n");
    }

    absl::StrAppend(&data, "\nPRIORITY BREAKDOWN:\n");
    for (Level level : kAllLevels) {
        absl::StrAppend(&data, "- ", LevelName(level), ": ",
                        overview.priority_counts[static_cast<size_t>(level)], " cases\n");
    }

    const std::string_view format(kResponseFormat);
    if (format.size() >= config_.max_prompt_chars) {
        return std::string(format.substr(0, config_.max_prompt_chars));
    }
    const size_t data_budget = config_.max_prompt_chars - format.size();
    if (data.size() > data_budget) {
        data.resize(data_budget);
    }
    return absl::StrCat(data, format);
}

InsightReport InsightsGenerator::NoDataReport(const AnalyticsOverview& overview) const {
    InsightReport report;
    report.generated_at = clock_();
    report.title = kDefaultTitle;
    report.summary_text =
        "No customer interactions recorded yet. Start processing customer requests to "
        "generate insights.";
    report.key_findings = {"No data to analyze"};
    report.recommendations = {"Begin collecting customer interaction data"};
    report.trends = "Insufficient data for trend analysis";
    report.severity = Level::kLow;
    report.data_points = 0;
    report.based_on_bucket_count = overview.bucket_count;
    report.source = "rule_based";
    return report;
}

InsightReport InsightsGenerator::RuleBasedReport(const AnalyticsOverview& overview) const {
    const double high_priority_rate = overview.HighPriorityRate();
    const double low_satisfaction_rate = overview.LowSatisfactionRate();

    InsightReport report;
    report.generated_at = clock_();
    report.title = kDefaultTitle;
    report.summary_text = absl::StrCat(
        "Analyzed ", overview.total, " customer interactions with ",
        Percent(high_priority_rate), " high priority and ", Percent(low_satisfaction_rate),
        " predicted low satisfaction.");

    report.key_findings = {
        absl::StrCat("Total interactions processed: ", overview.total),
        absl::StrCat("High priority cases: ", overview.high_priority, " (",
                     Percent(high_priority_rate), ")"),
        absl::StrCat("Customer satisfaction: ", Percent(100.0 - low_satisfaction_rate),
                     " medium or high"),
    };

    report.alerts = analytics::RuleBasedAlerts(overview);
    const bool attention = !report.alerts.empty();
    if (!attention) {
        report.alerts.push_back("System operating within normal parameters");
    }

    report.recommendations = {
        "Continue monitoring customer satisfaction trends",
        high_priority_rate > 20.0 ? "Review high priority case resolution processes"
                                  : "Maintain current service levels",
    };

    report.trends = attention ? "Attention needed in highlighted areas"
                              : "Stable operational metrics observed";
    if (!overview.issue_distribution.empty() && overview.issue_distribution.front().second > 2) {
        const auto& [type, count] = overview.issue_distribution.front();
        absl::StrAppend(&report.trends, ". Most frequent issue type: ", IssueTypeName(type),
                        " (", count, " cases)");
    }

    report.severity = overview.severity;
    report.data_points = overview.total;
    report.based_on_bucket_count = overview.bucket_count;
    report.source = "rule_based";
    return report;
}

absl::StatusOr<std::string> InsightsGenerator::CallBackend(const std::string& prompt) {
    auto token = MakeCancellationToken();
    auto backend = backend_;

    std::future<absl::StatusOr<std::string>> pending;
    try {
        pending = pool_.Submit([backend, prompt, token]() {
            return backend->Generate(prompt, token);
        });
    } catch (const std::exception& e) {
        return InsightsBackendError(absl::StrCat("Cannot schedule backend call: ", e.what()));
    }

    if (pending.wait_for(config_.timeout) != std::future_status::ready) {
        token->store(true);
        return MakeError(ErrorCode::kInsightsBackendError, "insights_timeout",
                         absl::StrCat("Insights backend did not answer within ",
                                      config_.timeout.count(), " ms"));
    }

    try {
        return pending.get();
    } catch (const std::exception& e) {
        return InsightsBackendError(absl::StrCat("Insights backend raised: ", e.what()));
    }
}

std::shared_ptr<const InsightReport> InsightsGenerator::Publish(InsightReport report) {
    auto published = std::make_shared<const InsightReport>(std::move(report));
    latest_.Publish(published);
    return published;
}

std::shared_ptr<const InsightReport> InsightsGenerator::Generate(
    const std::vector<analytics::MetricBucket>& snapshot) {
    std::lock_guard<std::mutex> lock(generate_mutex_);

    const AnalyticsOverview overview = analytics::Summarize(snapshot);
    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        ++stats_.generations;
    }
    SUPPORTPULSE_COUNTER("insights_generations_total").Increment();

    if (overview.total == 0) {
        return Publish(NoDataReport(overview));
    }
    if (!backend_) {
        return Publish(RuleBasedReport(overview));
    }

    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        ++stats_.backend_calls;
    }

    absl::Status failure;
    auto reply = CallBackend(BuildPrompt(overview));
    if (reply.ok()) {
        auto narrative = ParseNarrative(*reply);
        if (narrative.ok()) {
            InsightReport report;
            report.generated_at = clock_();
            report.title = narrative->title.empty() ? kDefaultTitle : narrative->title;
            report.summary_text = std::move(narrative->overview);
            report.key_findings = std::move(narrative->key_findings);
            report.alerts = std::move(narrative->alerts);
            report.recommendations = std::move(narrative->recommendations);
            report.trends = std::move(narrative->trends);
            report.severity = overview.severity;
            report.data_points = overview.total;
            report.based_on_bucket_count = overview.bucket_count;
            report.source = "llm";

            SUPPORTPULSE_LOG_INFO("Generated insight report over {} predictions ({} severity)",
                                  overview.total, LevelName(overview.severity));
            return Publish(std::move(report));
        }
        failure = narrative.status();
    } else {
        failure = reply.status();
    }

    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        ++stats_.degraded;
    }
    SUPPORTPULSE_COUNTER("insights_degraded_total").Increment();
    SUPPORTPULSE_LOG_WARN("Insight generation degraded: {}", failure.message());

    auto previous = latest_.Get();
    if (previous && previous->source != "placeholder") {
        InsightReport report = *previous;
        report.degraded = true;
        return Publish(std::move(report));
    }

    InsightReport report = RuleBasedReport(overview);
    report.degraded = true;
    return Publish(std::move(report));
}

InsightsStats InsightsGenerator::GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace supportpulse::insights
