/// @file main.cpp
/// @brief SupportPulse CORS proxy entry point

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <thread>

#include <CLI/CLI.hpp>

#include "common/config.h"
#include "common/logging.h"
#include "proxy/cors_proxy.h"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int /*signal*/) {
    g_shutdown_requested = true;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"SupportPulse CORS proxy - browser relay in front of the gateway"};

    std::string config_path;
    int port = 0;
    std::string upstream;
    std::string log_level;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("-p,--port", port, "Proxy listen port");
    app.add_option("-u,--upstream", upstream, "Gateway base URL (http://host:port)");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");

    CLI11_PARSE(app, argc, argv);

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

    if (port > 0) config.Set("proxy.port", static_cast<int64_t>(port));
    if (!upstream.empty()) config.Set("proxy.upstream", upstream);
    if (!log_level.empty()) config.Set("logging.level", log_level);

    supportpulse::LogConfig log_config;
    log_config.name = "supportpulse-proxy";
    log_config.level = supportpulse::ParseLogLevel(config.GetString("logging.level", "info"));
    supportpulse::InitLogging(log_config);

    supportpulse::proxy::CorsProxy proxy(supportpulse::proxy::ProxyConfig::FromConfig(config));

    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto status = proxy.Start();
    if (!status.ok()) {
        SUPPORTPULSE_LOG_ERROR("Failed to start proxy: {}", status.message());
        return 1;
    }

    while (!g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    SUPPORTPULSE_LOG_INFO("Shutting down CORS proxy...");
    proxy.Stop();
    supportpulse::ShutdownLogging();
    return 0;
}
