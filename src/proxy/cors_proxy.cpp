/// @file cors_proxy.cpp
/// @brief CORS relay implementation

#include "proxy/cors_proxy.h"

#include <atomic>
#include <thread>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <httplib.h>

#include "common/logging.h"
#include "common/metrics.h"

namespace supportpulse::proxy {

namespace {

bool IsForwarded(const HttpRequest& request) {
    if (request.path == "/predict") {
        return request.method == HttpMethod::kPost;
    }
    if (request.path == "/health") {
        return request.method == HttpMethod::kGet || request.method == HttpMethod::kPost;
    }
    return false;
}

HttpRequest FromHttplib(const httplib::Request& req) {
    HttpRequest request;
    if (req.method == "POST") {
        request.method = HttpMethod::kPost;
    } else if (req.method == "OPTIONS") {
        request.method = HttpMethod::kOptions;
    }
    request.path = req.path;
    for (const auto& [key, value] : req.headers) {
        request.headers.emplace(key, value);
    }
    request.body = req.body;
    return request;
}

}  // namespace

ProxyConfig ProxyConfig::FromConfig(const Config& config) {
    ProxyConfig result;
    result.host = config.GetString("proxy.host", result.host);
    result.port = static_cast<int>(config.GetInt("proxy.port", result.port));
    result.upstream = config.GetString("proxy.upstream", result.upstream);
    result.threads = static_cast<int>(config.GetInt("proxy.threads", result.threads));

    const int64_t timeout_ms = config.GetInt("proxy.timeout_ms", result.timeout.count());
    if (timeout_ms > 0) {
        result.timeout = std::chrono::milliseconds(timeout_ms);
    }
    if (result.threads <= 0) {
        result.threads = 4;
    }
    return result;
}

void AddCorsHeaders(HttpResponse& response) {
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";
}

// =============================================================================
// HttpUpstreamClient
// =============================================================================

HttpUpstreamClient::HttpUpstreamClient(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {}

absl::StatusOr<UpstreamResponse> HttpUpstreamClient::Forward(HttpMethod method,
                                                             const std::string& path,
                                                             const std::string& body,
                                                             const std::string& content_type) {
    httplib::Client client(base_url_);
    if (!client.is_valid()) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid upstream URL: ", base_url_));
    }

    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout_);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout_ - seconds);
    client.set_connection_timeout(seconds.count(), micros.count());
    client.set_read_timeout(seconds.count(), micros.count());

    httplib::Result result = method == HttpMethod::kPost
        ? client.Post(path, body, content_type.empty() ? "application/json" : content_type)
        : client.Get(path);

    if (!result) {
        return absl::UnavailableError(absl::StrCat(
            "Upstream ", base_url_, " unreachable: ", httplib::to_string(result.error())));
    }

    UpstreamResponse response;
    response.status_code = result->status;
    response.content_type = result->get_header_value("Content-Type");
    response.body = result->body;
    return response;
}

// =============================================================================
// Listener
// =============================================================================

class CorsProxy::Server {
public:
    explicit Server(CorsProxy* proxy) : proxy_(proxy) {}

    ~Server() { Stop(); }

    absl::Status Start(const ProxyConfig& config) {
        server_ = std::make_unique<httplib::Server>();
        const int threads = config.threads;
        server_->new_task_queue = [threads] {
            return new httplib::ThreadPool(static_cast<size_t>(threads));
        };

        auto dispatch = [this](const httplib::Request& req, httplib::Response& res) {
            HttpResponse response = proxy_->Handle(FromHttplib(req));
            res.status = response.status_code;
            for (const auto& [key, value] : response.headers) {
                res.set_header(key, value);
            }
            if (!response.body.empty()) {
                res.set_content(response.body, response.content_type);
            }
        };
        server_->Get(".*", dispatch);
        server_->Post(".*", dispatch);
        server_->Options(".*", dispatch);

        server_->set_exception_handler(
            [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
                try {
                    if (ep) {
                        std::rethrow_exception(ep);
                    }
                } catch (const std::exception& e) {
                    SUPPORTPULSE_LOG_ERROR("Unhandled proxy error on {}: {}", req.path, e.what());
                } catch (...) {
                    SUPPORTPULSE_LOG_ERROR("Unhandled non-standard exception on {}", req.path);
                }
                HttpResponse response = HttpResponse::InternalError();
                AddCorsHeaders(response);
                res.status = response.status_code;
                for (const auto& [key, value] : response.headers) {
                    res.set_header(key, value);
                }
                res.set_content(response.body, response.content_type);
            });

        if (config.port == 0) {
            port_ = server_->bind_to_any_port(config.host);
        } else if (server_->bind_to_port(config.host, config.port)) {
            port_ = config.port;
        } else {
            port_ = -1;
        }
        if (port_ <= 0) {
            port_ = 0;
            return absl::UnavailableError(absl::StrCat(
                "Cannot bind proxy to ", config.host, ":", config.port));
        }

        running_ = true;
        listener_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                SUPPORTPULSE_LOG_ERROR("Proxy listener on port {} exited with an error", port_);
            }
        });
        SUPPORTPULSE_LOG_INFO("CORS proxy listening on {}:{} -> {}", config.host, port_,
                              config.upstream);
        return absl::OkStatus();
    }

    void Stop() {
        if (!running_.exchange(false)) {
            return;
        }
        server_->stop();
        if (listener_.joinable()) {
            listener_.join();
        }
    }

    int port_ = 0;

private:
    CorsProxy* proxy_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listener_;
    std::atomic<bool> running_{false};
};

// =============================================================================
// CorsProxy
// =============================================================================

CorsProxy::CorsProxy(ProxyConfig config, std::shared_ptr<UpstreamClient> upstream)
    : config_(std::move(config)),
      upstream_(upstream ? std::move(upstream)
                         : std::shared_ptr<UpstreamClient>(std::make_shared<HttpUpstreamClient>(
                               config_.upstream, config_.timeout))) {}

CorsProxy::~CorsProxy() {
    Stop();
}

HttpResponse CorsProxy::Handle(const HttpRequest& request) {
    SUPPORTPULSE_COUNTER("proxy_requests_total").Increment();

    HttpResponse response;
    if (request.method == HttpMethod::kOptions) {
        response.status_code = 200;
        response.content_type = "application/json";
    } else if (!IsForwarded(request)) {
        response = HttpResponse::NotFound(absl::StrCat("No route for ", request.path));
    } else {
        std::string content_type;
        for (const auto& [key, value] : request.headers) {
            if (absl::EqualsIgnoreCase(key, "Content-Type")) {
                content_type = value;
            }
        }

        auto upstream = upstream_->Forward(request.method, request.path, request.body,
                                           content_type);
        if (upstream.ok()) {
            response.status_code = upstream->status_code;
            response.body = std::move(upstream->body);
            response.content_type = upstream->content_type.empty() ? "application/json"
                                                                   : upstream->content_type;
        } else {
            SUPPORTPULSE_COUNTER("proxy_upstream_failures_total").Increment();
            SUPPORTPULSE_LOG_WARN("Relay of {} failed: {}", request.path,
                                  upstream.status().message());
            response = HttpResponse::Error(502, "upstream_unreachable",
                                           "Gateway could not be reached");
        }
    }

    AddCorsHeaders(response);
    return response;
}

absl::Status CorsProxy::Start() {
    if (server_) {
        return absl::FailedPreconditionError("Proxy already running");
    }
    server_ = std::make_unique<Server>(this);
    auto status = server_->Start(config_);
    if (!status.ok()) {
        server_.reset();
    }
    return status;
}

void CorsProxy::Stop() {
    if (server_) {
        server_->Stop();
        server_.reset();
    }
}

int CorsProxy::Port() const {
    return server_ ? server_->port_ : 0;
}

}  // namespace supportpulse::proxy
