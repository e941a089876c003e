/// @file main.cpp
/// @brief SupportPulse server entry point

#include <csignal>
#include <iostream>
#include <optional>

#include <CLI/CLI.hpp>

#include "common/config.h"
#include "common/logging.h"
#include "gateway/server.h"

namespace {

supportpulse::gateway::SupportPulseServer* g_server = nullptr;

void SignalHandler(int signal) {
    SUPPORTPULSE_LOG_INFO("Received signal {}, initiating shutdown", signal);
    if (g_server) {
        g_server->RequestShutdown();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"SupportPulse - customer support prediction and analytics service"};

    std::string config_path;
    std::string host;
    int port = 0;
    std::string models_dir;
    std::string ollama_url;
    std::string ollama_model;
    std::string log_level;
    std::string log_file;
    bool no_insights = false;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--host", host, "HTTP listen address");
    app.add_option("-p,--port", port, "HTTP listen port");
    app.add_option("--models-dir", models_dir, "Directory of model artifacts (*.json)");
    app.add_option("--ollama-url", ollama_url, "Insights backend base URL");
    app.add_option("--ollama-model", ollama_model, "Insights backend model");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--log-file", log_file, "Also log to this rotating file");
    app.add_flag("--no-insights", no_insights, "Use rule-based insights only");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "SupportPulse v" << supportpulse::gateway::kServiceVersion << std::endl;
        return 0;
    }

    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    auto config_or = supportpulse::LoadConfig(path);
    if (!config_or.ok()) {
        std::cerr << "Failed to load config: " << config_or.status().message() << std::endl;
        return 1;
    }
    supportpulse::Config config = std::move(*config_or);

    // Command line flags override file and environment
    if (!host.empty()) config.Set("gateway.host", host);
    if (port > 0) config.Set("gateway.port", static_cast<int64_t>(port));
    if (!models_dir.empty()) config.Set("models.directory", models_dir);
    if (!ollama_url.empty()) config.Set("insights.backend_url", ollama_url);
    if (!ollama_model.empty()) config.Set("insights.model", ollama_model);
    if (!log_level.empty()) config.Set("logging.level", log_level);
    if (!log_file.empty()) config.Set("logging.file", log_file);
    if (no_insights) config.Set("insights.enabled", false);

    supportpulse::LogConfig log_config;
    log_config.name = "supportpulse-server";
    log_config.level = supportpulse::ParseLogLevel(config.GetString("logging.level", "info"));
    log_config.file_path = config.GetString("logging.file", "");
    log_config.enable_file = !log_config.file_path.empty();
    supportpulse::InitLogging(log_config);

    SUPPORTPULSE_LOG_INFO("SupportPulse v{} starting...", supportpulse::gateway::kServiceVersion);

    SUPPORTPULSE_LOG_DEBUG("Effective configuration: {}", config.ToJson().dump());

    auto server_config = supportpulse::gateway::ServerConfig::FromConfig(config);
    SUPPORTPULSE_LOG_INFO("Configuration:");
    SUPPORTPULSE_LOG_INFO("  HTTP endpoint: {}:{}", server_config.gateway.host,
                          server_config.gateway.port);
    SUPPORTPULSE_LOG_INFO("  Models: {}", server_config.registry.models_directory.empty()
                                              ? std::string("(built-in)")
                                              : server_config.registry.models_directory.string());
    SUPPORTPULSE_LOG_INFO("  Buckets: {}s width, {}s retention",
                          server_config.analytics.bucket_width.count(),
                          server_config.analytics.retention.count());
    SUPPORTPULSE_LOG_INFO("  Insights: {} ({})",
                          server_config.insights.enabled ? "enabled" : "rule-based",
                          server_config.insights.backend.base_url);

    supportpulse::gateway::SupportPulseServer server(std::move(server_config));
    g_server = &server;

    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto status = server.Start();
    if (!status.ok()) {
        SUPPORTPULSE_LOG_ERROR("Failed to start server: {}", status.message());
        g_server = nullptr;
        return 1;
    }

    SUPPORTPULSE_LOG_INFO("Server is running. Press Ctrl+C to stop.");
    server.WaitForShutdown();

    status = server.Shutdown();
    if (!status.ok()) {
        SUPPORTPULSE_LOG_ERROR("Error during shutdown: {}", status.message());
    }
    g_server = nullptr;

    SUPPORTPULSE_LOG_INFO("Server stopped, {} prediction(s) recorded",
                          server.Aggregator()->TotalRecorded());
    supportpulse::ShutdownLogging();
    return 0;
}
