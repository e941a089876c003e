#pragma once

/// @file server.h
/// @brief SupportPulse server process: wiring and lifecycle of all components

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "actions/action_manager.h"
#include "actions/escalation_action.h"
#include "analytics/aggregator.h"
#include "analytics/analytics_sink.h"
#include "common/config.h"
#include "gateway/api_server.h"
#include "gateway/read_handlers.h"
#include "gateway/request_gateway.h"
#include "inference/orchestrator.h"
#include "insights/insights_generator.h"
#include "insights/insights_scheduler.h"
#include "registry/model_registry.h"

namespace supportpulse::gateway {

/// Complete server configuration
struct ServerConfig {
    GatewayConfig gateway;
    registry::RegistryConfig registry;
    inference::OrchestratorConfig orchestrator;
    analytics::AggregatorConfig analytics;
    insights::InsightsConfig insights;
    actions::ActionsConfig actions;
    actions::EscalationConfig escalation;

    /// Analytics events that may wait for the aggregator
    size_t analytics_queue_size = 10000;

    static ServerConfig FromConfig(const Config& config);
};

/// @brief Owns every component of the prediction service
class SupportPulseServer {
public:
    /// @param backend Insights backend; null creates the configured one
    explicit SupportPulseServer(ServerConfig config,
                                std::shared_ptr<insights::TextGenerator> backend = nullptr);
    ~SupportPulseServer();

    SupportPulseServer(const SupportPulseServer&) = delete;
    SupportPulseServer& operator=(const SupportPulseServer&) = delete;

    /// @brief Load models, start background tasks and the HTTP listener
    absl::Status Start();

    /// @brief Stop the listener first, then drain background work
    absl::Status Shutdown();

    /// @brief Block until RequestShutdown()
    void WaitForShutdown();

    void RequestShutdown();

    /// @brief Bound HTTP port
    int Port() const;

    std::shared_ptr<analytics::AnalyticsAggregator> Aggregator() const { return aggregator_; }
    std::shared_ptr<analytics::AsyncAnalyticsSink> Sink() const { return sink_; }
    std::shared_ptr<insights::InsightsGenerator> Generator() const { return generator_; }
    std::shared_ptr<registry::ModelRegistry> Registry() const { return registry_; }

    /// @brief Null when actions are disabled
    std::shared_ptr<actions::ActionManager> Actions() const { return actions_; }

    const ServerConfig& GetConfig() const { return config_; }

private:
    ServerConfig config_;
    std::shared_ptr<insights::TextGenerator> backend_;

    std::shared_ptr<registry::ModelRegistry> registry_;
    std::shared_ptr<inference::InferenceOrchestrator> orchestrator_;
    std::shared_ptr<analytics::AnalyticsAggregator> aggregator_;
    std::shared_ptr<analytics::AsyncAnalyticsSink> sink_;
    std::shared_ptr<actions::ActionManager> actions_;
    std::shared_ptr<insights::InsightsGenerator> generator_;
    std::shared_ptr<insights::InsightsScheduler> scheduler_;
    std::shared_ptr<RequestGateway> gateway_;
    std::shared_ptr<ReadHandlers> read_handlers_;
    std::unique_ptr<ApiServer> api_server_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::mutex shutdown_mutex_;
    std::condition_variable shutdown_cv_;
};

}  // namespace supportpulse::gateway
