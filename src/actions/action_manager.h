#pragma once

/// @file action_manager.h
/// @brief Ordered, time-bounded execution of post-prediction actions

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <nlohmann/json.hpp>

#include "actions/action.h"
#include "common/config.h"
#include "common/thread_pool.h"

namespace supportpulse::actions {

/// @brief Action pipeline configuration (`actions.*`)
struct ActionsConfig {
    bool enabled = true;

    /// Workers for dispatch and for action calls, each
    size_t threads = 2;

    /// Predictions that may wait for dispatch
    size_t max_queue = 1000;

    /// Deadline of one Execute() call
    std::chrono::milliseconds timeout{5000};

    /// When false, a failure skips the remaining actions of that prediction
    bool continue_on_failure = true;

    static ActionsConfig FromConfig(const Config& config);
};

struct SkippedAction {
    std::string action;
    std::string reason;  ///< "disabled", "conditions_not_met" or "aborted"
};

struct FailedAction {
    std::string action;
    std::string error;
    std::string phase;  ///< "should_execute" or "execution"
};

/// @brief Outcome of running the pipeline for one prediction
struct ActionReport {
    std::vector<std::string> executed;
    std::vector<SkippedAction> skipped;
    std::vector<FailedAction> failed;
};

nlohmann::json ToJson(const ActionReport& report);

struct ActionInfo {
    std::string name;
    int priority = 100;
    bool enabled = true;
};

struct ActionStats {
    int64_t dispatched = 0;
    int64_t rejected = 0;
    int64_t executed = 0;
    int64_t skipped = 0;
    int64_t failed = 0;
    int64_t timeouts = 0;
};

/// @brief Runs registered actions for each prediction
///
/// Actions run in ascending priority order (lower first, registration order
/// on ties). A predicate that throws, an Execute() that fails, throws or
/// misses the deadline is recorded as failed; none of them reaches the
/// caller. An action that misses its deadline keeps its worker until it
/// returns.
class ActionManager {
public:
    explicit ActionManager(ActionsConfig config = {});
    ~ActionManager();

    ActionManager(const ActionManager&) = delete;
    ActionManager& operator=(const ActionManager&) = delete;

    /// @return InvalidArgument for a null action, AlreadyExists for a taken name
    absl::Status Register(std::shared_ptr<Action> action, int priority, bool enabled = true);

    /// @brief Run every action for a prediction on the calling thread
    ActionReport Run(const inference::Prediction& prediction);

    /// @brief Queue a prediction for Run() on a background worker
    /// @return ResourceExhausted when the queue is full, Unavailable after Shutdown()
    absl::Status Dispatch(const inference::Prediction& prediction);

    /// @brief Wait until every dispatched prediction has been processed
    void Flush();

    /// @brief Drain dispatched predictions and reject new ones
    void Shutdown();

    std::vector<ActionInfo> ListActions() const;
    ActionStats GetStats() const;
    const ActionsConfig& GetConfig() const { return config_; }

private:
    struct Registered {
        std::shared_ptr<Action> action;
        int priority;
        bool enabled;
    };

    ActionsConfig config_;

    mutable std::mutex actions_mutex_;
    std::vector<Registered> actions_;

    mutable std::mutex stats_mutex_;
    ActionStats stats_;

    // Dispatch workers wait on execution workers, so dispatch stops first
    ThreadPool execution_pool_;
    ThreadPool dispatch_pool_;
    std::atomic<bool> stopped_{false};
};

}  // namespace supportpulse::actions
