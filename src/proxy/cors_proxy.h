#pragma once

/// @file cors_proxy.h
/// @brief Cross-origin relay in front of the gateway for browser clients

#include <chrono>
#include <memory>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "gateway/http_types.h"

namespace supportpulse::proxy {

using gateway::HttpMethod;
using gateway::HttpRequest;
using gateway::HttpResponse;

/// @brief Proxy configuration (`proxy.*`)
struct ProxyConfig {
    std::string host = "0.0.0.0";
    int port = 8081;  ///< 0 binds an ephemeral port
    std::string upstream = "http://localhost:8080";
    std::chrono::milliseconds timeout{10000};
    int threads = 4;

    static ProxyConfig FromConfig(const Config& config);
};

/// @brief Status, content type and body returned by the gateway
struct UpstreamResponse {
    int status_code = 0;
    std::string content_type;
    std::string body;
};

/// @brief Transport to the gateway
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    /// @return Unavailable on transport failure; any HTTP status is a success
    virtual absl::StatusOr<UpstreamResponse> Forward(HttpMethod method,
                                                     const std::string& path,
                                                     const std::string& body,
                                                     const std::string& content_type) = 0;
};

/// @brief UpstreamClient over cpp-httplib
class HttpUpstreamClient : public UpstreamClient {
public:
    HttpUpstreamClient(std::string base_url, std::chrono::milliseconds timeout);

    absl::StatusOr<UpstreamResponse> Forward(HttpMethod method,
                                             const std::string& path,
                                             const std::string& body,
                                             const std::string& content_type) override;

private:
    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

/// @brief Adds permissive CORS headers to a response
void AddCorsHeaders(HttpResponse& response);

/// @brief Stateless relay of /predict and /health
///
/// OPTIONS is answered locally. Upstream status and body pass through
/// verbatim; transport failures become 502 upstream_unreachable and unknown
/// paths 404. Nothing is retried.
class CorsProxy {
public:
    CorsProxy(ProxyConfig config, std::shared_ptr<UpstreamClient> upstream = nullptr);
    ~CorsProxy();

    CorsProxy(const CorsProxy&) = delete;
    CorsProxy& operator=(const CorsProxy&) = delete;

    /// @brief Route one request
    HttpResponse Handle(const HttpRequest& request);

    absl::Status Start();
    void Stop();

    /// @brief Bound port, 0 before Start()
    int Port() const;

    const ProxyConfig& GetConfig() const { return config_; }

private:
    class Server;

    ProxyConfig config_;
    std::shared_ptr<UpstreamClient> upstream_;
    std::unique_ptr<Server> server_;
};

}  // namespace supportpulse::proxy
