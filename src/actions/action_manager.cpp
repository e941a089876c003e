/// @file action_manager.cpp
/// @brief Action pipeline implementation

#include "actions/action_manager.h"

#include <algorithm>
#include <future>

#include <absl/strings/str_cat.h>

#include "common/logging.h"
#include "common/metrics.h"

namespace supportpulse::actions {

using json = nlohmann::json;

ActionsConfig ActionsConfig::FromConfig(const Config& config) {
    ActionsConfig result;
    result.enabled = config.GetBool("actions.enabled", result.enabled);
    result.continue_on_failure =
        config.GetBool("actions.continue_on_failure", result.continue_on_failure);

    const int64_t threads = config.GetInt("actions.threads",
                                          static_cast<int64_t>(result.threads));
    if (threads > 0) {
        result.threads = static_cast<size_t>(threads);
    }
    const int64_t max_queue = config.GetInt("actions.max_queue",
                                            static_cast<int64_t>(result.max_queue));
    if (max_queue > 0) {
        result.max_queue = static_cast<size_t>(max_queue);
    }
    const int64_t timeout_ms = config.GetInt("actions.timeout_ms", result.timeout.count());
    if (timeout_ms > 0) {
        result.timeout = std::chrono::milliseconds(timeout_ms);
    }
    return result;
}

json ToJson(const ActionReport& report) {
    json skipped = json::array();
    for (const auto& entry : report.skipped) {
        skipped.push_back({{"action", entry.action}, {"reason", entry.reason}});
    }
    json failed = json::array();
    for (const auto& entry : report.failed) {
        failed.push_back({{"action", entry.action}, {"error", entry.error},
                          {"phase", entry.phase}});
    }
    return json{
        {"executed", report.executed},
        {"skipped", skipped},
        {"failed", failed},
    };
}

ActionManager::ActionManager(ActionsConfig config)
    : config_(std::move(config)),
      execution_pool_(config_.threads == 0 ? 1 : config_.threads),
      dispatch_pool_(config_.threads == 0 ? 1 : config_.threads, config_.max_queue) {}

ActionManager::~ActionManager() {
    Shutdown();
}

absl::Status ActionManager::Register(std::shared_ptr<Action> action, int priority, bool enabled) {
    if (!action) {
        return absl::InvalidArgumentError("Cannot register a null action");
    }

    std::lock_guard<std::mutex> lock(actions_mutex_);
    const std::string name = action->Name();
    for (const auto& registered : actions_) {
        if (registered.action->Name() == name) {
            return absl::AlreadyExistsError(
                absl::StrCat("Action '", name, "' is already registered"));
        }
    }

    actions_.push_back({std::move(action), priority, enabled});
    std::stable_sort(actions_.begin(), actions_.end(),
                     [](const Registered& a, const Registered& b) {
                         return a.priority < b.priority;
                     });

    SUPPORTPULSE_LOG_INFO("Registered action '{}' (priority {}, {})", name, priority,
                          enabled ? "enabled" : "disabled");
    return absl::OkStatus();
}

ActionReport ActionManager::Run(const inference::Prediction& prediction) {
    std::vector<Registered> actions;
    {
        std::lock_guard<std::mutex> lock(actions_mutex_);
        actions = actions_;
    }

    ActionReport report;
    int64_t timeouts = 0;
    bool aborted = false;

    for (const auto& registered : actions) {
        const std::string name = registered.action->Name();
        if (!registered.enabled) {
            report.skipped.push_back({name, "disabled"});
            continue;
        }
        if (aborted) {
            report.skipped.push_back({name, "aborted"});
            continue;
        }

        bool applies = false;
        try {
            applies = registered.action->ShouldExecute(prediction);
        } catch (const std::exception& e) {
            report.failed.push_back({name, e.what(), "should_execute"});
            aborted = !config_.continue_on_failure;
            continue;
        } catch (...) {
            report.failed.push_back({name, "non-standard exception", "should_execute"});
            aborted = !config_.continue_on_failure;
            continue;
        }
        if (!applies) {
            report.skipped.push_back({name, "conditions_not_met"});
            continue;
        }

        auto action = registered.action;
        std::future<absl::Status> pending;
        try {
            pending = execution_pool_.Submit([action, prediction]() -> absl::Status {
                SUPPORTPULSE_GAUGE("actions_in_flight").Increment();
                absl::Status status;
                try {
                    status = action->Execute(prediction);
                } catch (const std::exception& e) {
                    status = absl::InternalError(absl::StrCat("raised: ", e.what()));
                } catch (...) {
                    status = absl::InternalError("raised a non-standard exception");
                }
                SUPPORTPULSE_GAUGE("actions_in_flight").Decrement();
                return status;
            });
        } catch (const std::exception& e) {
            report.failed.push_back({name, e.what(), "execution"});
            aborted = !config_.continue_on_failure;
            continue;
        }

        if (pending.wait_for(config_.timeout) != std::future_status::ready) {
            ++timeouts;
            report.failed.push_back({name, "timeout", "execution"});
            SUPPORTPULSE_LOG_WARN("Action '{}' did not finish within {} ms", name,
                                  config_.timeout.count());
            aborted = !config_.continue_on_failure;
            continue;
        }

        absl::Status status = pending.get();
        if (!status.ok()) {
            report.failed.push_back({name, std::string(status.message()), "execution"});
            SUPPORTPULSE_LOG_WARN("Action '{}' failed: {}", name, status.message());
            aborted = !config_.continue_on_failure;
            continue;
        }
        report.executed.push_back(name);
    }

    SUPPORTPULSE_COUNTER("actions_executed_total").Add(
        static_cast<int64_t>(report.executed.size()));
    SUPPORTPULSE_COUNTER("actions_skipped_total").Add(static_cast<int64_t>(report.skipped.size()));
    SUPPORTPULSE_COUNTER("actions_failed_total").Add(static_cast<int64_t>(report.failed.size()));
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.executed += static_cast<int64_t>(report.executed.size());
        stats_.skipped += static_cast<int64_t>(report.skipped.size());
        stats_.failed += static_cast<int64_t>(report.failed.size());
        stats_.timeouts += timeouts;
    }
    return report;
}

absl::Status ActionManager::Dispatch(const inference::Prediction& prediction) {
    if (stopped_.load(std::memory_order_acquire)) {
        return absl::UnavailableError("Action pipeline is stopped");
    }

    const bool accepted = dispatch_pool_.TryExecute([this, prediction]() { Run(prediction); });

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!accepted) {
        ++stats_.rejected;
        SUPPORTPULSE_COUNTER("actions_dispatch_rejected_total").Increment();
        if (dispatch_pool_.IsStopped()) {
            return absl::UnavailableError("Action pipeline is stopped");
        }
        return absl::ResourceExhaustedError("Action queue is full");
    }
    ++stats_.dispatched;
    return absl::OkStatus();
}

void ActionManager::Flush() {
    dispatch_pool_.Wait();
}

void ActionManager::Shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    dispatch_pool_.Shutdown();
    execution_pool_.Shutdown();
}

std::vector<ActionInfo> ActionManager::ListActions() const {
    std::lock_guard<std::mutex> lock(actions_mutex_);
    std::vector<ActionInfo> infos;
    infos.reserve(actions_.size());
    for (const auto& registered : actions_) {
        infos.push_back({registered.action->Name(), registered.priority, registered.enabled});
    }
    return infos;
}

ActionStats ActionManager::GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace supportpulse::actions
