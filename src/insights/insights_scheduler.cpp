#include "insights/insights_scheduler.h"

#include "common/logging.h"

namespace supportpulse::insights {

InsightsScheduler::InsightsScheduler(
    std::shared_ptr<InsightsGenerator> generator,
    std::shared_ptr<analytics::AnalyticsAggregator> aggregator)
    : generator_(std::move(generator)), aggregator_(std::move(aggregator)) {}

InsightsScheduler::~InsightsScheduler() {
    Stop();
}

void InsightsScheduler::Start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&InsightsScheduler::Loop, this);
    SUPPORTPULSE_LOG_INFO("Insights scheduler started (every {}s, min {} new predictions)",
                          generator_->GetConfig().interval.count(),
                          generator_->GetConfig().min_new_predictions);
}

void InsightsScheduler::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    SUPPORTPULSE_LOG_INFO("Insights scheduler stopped");
}

void InsightsScheduler::Trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trigger_requested_ = true;
    }
    wake_.notify_all();
}

bool InsightsScheduler::RunOnce(bool force) {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    cycles_.fetch_add(1);

    const int64_t total = aggregator_->TotalRecorded();
    const int64_t fresh = total - last_seen_total_;
    const bool missing = generator_->Latest() == nullptr;

    if (!force && !missing && fresh < generator_->GetConfig().min_new_predictions) {
        SUPPORTPULSE_LOG_TRACE("Skipping insight cycle: {} new prediction(s)", fresh);
        return false;
    }

    last_seen_total_ = total;
    auto report = generator_->Generate(aggregator_->Snapshot(generator_->GetConfig().window));
    SUPPORTPULSE_LOG_DEBUG("Insight cycle done ({} data points, degraded={})",
                           report->data_points, report->degraded);
    return true;
}

void InsightsScheduler::Loop() {
    const auto interval = generator_->GetConfig().interval;

    while (true) {
        bool forced = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait_for(lock, interval, [this] {
                return stop_requested_ || trigger_requested_;
            });
            if (stop_requested_) {
                return;
            }
            forced = trigger_requested_;
            trigger_requested_ = false;
        }

        try {
            RunOnce(forced);
        } catch (const std::exception& e) {
            SUPPORTPULSE_LOG_ERROR("Insight cycle failed: {}", e.what());
        }
    }
}

}  // namespace supportpulse::insights
