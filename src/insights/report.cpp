#include "insights/report.h"

#include "common/error.h"

namespace supportpulse::insights {

using json = nlohmann::json;

namespace {

std::vector<std::string> StringList(const json& object, const char* key) {
    std::vector<std::string> items;
    auto it = object.find(key);
    if (it == object.end()) {
        return items;
    }
    if (it->is_string()) {
        items.push_back(it->get<std::string>());
        return items;
    }
    if (it->is_array()) {
        for (const auto& item : *it) {
            if (item.is_string()) {
                items.push_back(item.get<std::string>());
            }
        }
    }
    return items;
}

std::string Text(const json& object, const char* key) {
    auto it = object.find(key);
    if (it != object.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

}  // namespace

json ToJson(const InsightReport& report) {
    return json{
        {"generated_at", FormatTimestamp(report.generated_at)},
        {"title", report.title},
        {"summary_text", report.summary_text},
        {"key_findings", report.key_findings},
        {"alerts", report.alerts},
        {"recommendations", report.recommendations},
        {"trends", report.trends},
        {"severity", LevelName(report.severity)},
        {"data_points", report.data_points},
        {"based_on_bucket_count", report.based_on_bucket_count},
        {"degraded", report.degraded},
        {"source", report.source},
    };
}

absl::StatusOr<GeneratedNarrative> ParseNarrative(std::string_view reply) {
    const auto start = reply.find('{');
    const auto end = reply.rfind('}');
    if (start == std::string_view::npos || end == std::string_view::npos || end < start) {
        return InsightsBackendError("Backend reply contains no JSON object");
    }

    json parsed = json::parse(reply.substr(start, end - start + 1), nullptr,
                              /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return InsightsBackendError("Backend reply JSON could not be parsed");
    }

    GeneratedNarrative narrative;
    narrative.title = Text(parsed, "title");
    narrative.overview = Text(parsed, "overview");
    narrative.key_findings = StringList(parsed, "key_findings");
    narrative.alerts = StringList(parsed, "alerts");
    narrative.recommendations = StringList(parsed, "recommendations");
    narrative.trends = Text(parsed, "trends");

    if (narrative.overview.empty() && narrative.key_findings.empty() &&
        narrative.recommendations.empty()) {
        return InsightsBackendError("Backend reply has no overview, findings or recommendations");
    }
    return narrative;
}

InsightReport PlaceholderReport(std::chrono::system_clock::time_point now) {
    InsightReport report;
    report.generated_at = now;
    report.title = "Generating insight...";
    report.summary_text = "The first insight report is being generated.";
    report.source = "placeholder";
    return report;
}

void LatestReportCell::Publish(std::shared_ptr<const InsightReport> report) {
    std::lock_guard<std::mutex> lock(mutex_);
    report_ = std::move(report);
}

std::shared_ptr<const InsightReport> LatestReportCell::Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_;
}

}  // namespace supportpulse::insights
