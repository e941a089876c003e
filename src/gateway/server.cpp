/// @file server.cpp
/// @brief SupportPulse server lifecycle

#include "gateway/server.h"

#include "common/logging.h"

namespace supportpulse::gateway {

ServerConfig ServerConfig::FromConfig(const Config& config) {
    ServerConfig result;
    result.gateway = GatewayConfig::FromConfig(config);
    result.registry = registry::RegistryConfig::FromConfig(config);
    result.orchestrator = inference::OrchestratorConfig::FromConfig(config);
    result.analytics = analytics::AggregatorConfig::FromConfig(config);
    result.insights = insights::InsightsConfig::FromConfig(config);
    result.actions = actions::ActionsConfig::FromConfig(config);
    result.escalation = actions::EscalationConfig::FromConfig(config);

    const int64_t queue = config.GetInt("analytics.queue_size",
                                        static_cast<int64_t>(result.analytics_queue_size));
    if (queue > 0) {
        result.analytics_queue_size = static_cast<size_t>(queue);
    }
    return result;
}

SupportPulseServer::SupportPulseServer(ServerConfig config,
                                       std::shared_ptr<insights::TextGenerator> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {}

SupportPulseServer::~SupportPulseServer() {
    auto status = Shutdown();
    if (!status.ok()) {
        SUPPORTPULSE_LOG_ERROR("Error during shutdown: {}", status.message());
    }
}

absl::Status SupportPulseServer::Start() {
    if (running_.load()) {
        return absl::FailedPreconditionError("Server already running");
    }

    registry_ = std::make_shared<registry::ModelRegistry>(config_.registry);
    auto status = registry_->Initialize();
    if (!status.ok()) {
        return status;
    }

    orchestrator_ = std::make_shared<inference::InferenceOrchestrator>(
        registry_, config_.orchestrator);
    aggregator_ = std::make_shared<analytics::AnalyticsAggregator>(config_.analytics);
    sink_ = std::make_shared<analytics::AsyncAnalyticsSink>(aggregator_, 1,
                                                            config_.analytics_queue_size);

    if (config_.actions.enabled) {
        actions_ = std::make_shared<actions::ActionManager>(config_.actions);
        if (config_.escalation.enabled) {
            status = actions_->Register(
                std::make_shared<actions::EscalationAction>(config_.escalation),
                config_.escalation.priority);
            if (!status.ok()) {
                return status;
            }
        }
    }

    if (!backend_) {
        backend_ = insights::CreateTextGenerator(config_.insights);
    }
    generator_ = std::make_shared<insights::InsightsGenerator>(backend_, config_.insights);
    scheduler_ = std::make_shared<insights::InsightsScheduler>(generator_, aggregator_);

    gateway_ = std::make_shared<RequestGateway>(orchestrator_, registry_, sink_, config_.gateway,
                                                actions_);
    read_handlers_ = std::make_shared<ReadHandlers>(aggregator_, generator_, scheduler_);
    api_server_ = std::make_unique<ApiServer>(gateway_, read_handlers_, config_.gateway);

    status = api_server_->Start();
    if (!status.ok()) {
        return status;
    }
    scheduler_->Start();

    running_ = true;
    shutdown_requested_ = false;
    SUPPORTPULSE_LOG_INFO("SupportPulse server ready on port {} ({} model(s), insights {})",
                          api_server_->Port(), registry_->Size(),
                          backend_ ? backend_->Name() : std::string("rule-based"));
    return absl::OkStatus();
}

absl::Status SupportPulseServer::Shutdown() {
    if (!running_.exchange(false)) {
        return absl::OkStatus();
    }

    SUPPORTPULSE_LOG_INFO("Shutting down SupportPulse server...");
    if (api_server_) {
        api_server_->Stop();
    }
    if (scheduler_) {
        scheduler_->Stop();
    }
    if (sink_) {
        sink_->Shutdown();
    }
    if (actions_) {
        actions_->Shutdown();
    }
    RequestShutdown();
    SUPPORTPULSE_LOG_INFO("SupportPulse server shutdown complete");
    return absl::OkStatus();
}

void SupportPulseServer::WaitForShutdown() {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.wait(lock, [this] { return shutdown_requested_.load(); });
}

void SupportPulseServer::RequestShutdown() {
    shutdown_requested_ = true;
    shutdown_cv_.notify_all();
}

int SupportPulseServer::Port() const {
    return api_server_ ? api_server_->Port() : 0;
}

}  // namespace supportpulse::gateway
