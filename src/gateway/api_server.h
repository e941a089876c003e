#pragma once

/// @file api_server.h
/// @brief cpp-httplib server exposing the gateway and read APIs

#include <memory>

#include <absl/status/status.h>

#include "gateway/read_handlers.h"
#include "gateway/request_gateway.h"

namespace supportpulse::gateway {

/// @brief HTTP server running on its own listener thread
///
/// Routes:
///   POST /predict, GET /health,
///   GET /metrics, GET /metrics/internal, GET /api/analytics/summary,
///   GET /api/insights, POST /api/insights/generate
class ApiServer {
public:
    ApiServer(std::shared_ptr<RequestGateway> gateway,
              std::shared_ptr<ReadHandlers> read_handlers,
              GatewayConfig config);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /// @brief Bind and start listening; port 0 picks a free port
    absl::Status Start();

    void Stop();

    /// @brief Bound port, 0 before Start()
    int Port() const;

    bool IsRunning() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace supportpulse::gateway
