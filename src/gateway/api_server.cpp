/// @file api_server.cpp
/// @brief HTTP binding of the gateway handlers

#include "gateway/api_server.h"

#include <atomic>
#include <thread>

#include <absl/strings/str_cat.h>
#include <httplib.h>

#include "common/logging.h"

namespace supportpulse::gateway {

namespace {

HttpRequest FromHttplib(const httplib::Request& req) {
    HttpRequest request;
    if (req.method == "POST") {
        request.method = HttpMethod::kPost;
    } else if (req.method == "OPTIONS") {
        request.method = HttpMethod::kOptions;
    }
    request.path = req.path;
    for (const auto& [key, value] : req.params) {
        request.query_params.emplace(key, value);
    }
    for (const auto& [key, value] : req.headers) {
        request.headers.emplace(key, value);
    }
    request.body = req.body;
    return request;
}

void ApplyResponse(const HttpResponse& response, httplib::Response& res) {
    res.status = response.status_code;
    for (const auto& [key, value] : response.headers) {
        res.set_header(key, value);
    }
    res.set_content(response.body, response.content_type);
}

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class ApiServer::Impl {
public:
    Impl(std::shared_ptr<RequestGateway> gateway,
         std::shared_ptr<ReadHandlers> read_handlers,
         GatewayConfig config)
        : gateway_(std::move(gateway)),
          read_handlers_(std::move(read_handlers)),
          config_(std::move(config)) {}

    ~Impl() { Stop(); }

    absl::Status Start() {
        if (running_.load()) {
            return absl::FailedPreconditionError("API server already running");
        }

        server_ = std::make_unique<httplib::Server>();
        const int threads = config_.threads;
        server_->new_task_queue = [threads] {
            return new httplib::ThreadPool(static_cast<size_t>(threads));
        };

        RegisterRoutes();

        if (config_.port == 0) {
            port_ = server_->bind_to_any_port(config_.host);
        } else if (server_->bind_to_port(config_.host, config_.port)) {
            port_ = config_.port;
        } else {
            port_ = -1;
        }
        if (port_ <= 0) {
            port_ = 0;
            return absl::UnavailableError(absl::StrCat(
                "Cannot bind HTTP server to ", config_.host, ":", config_.port));
        }

        running_ = true;
        listener_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                SUPPORTPULSE_LOG_ERROR("HTTP listener on port {} exited with an error", port_);
            }
        });

        SUPPORTPULSE_LOG_INFO("HTTP server listening on {}:{}", config_.host, port_);
        return absl::OkStatus();
    }

    void Stop() {
        if (!running_.exchange(false)) {
            return;
        }
        if (server_) {
            server_->stop();
        }
        if (listener_.joinable()) {
            listener_.join();
        }
        SUPPORTPULSE_LOG_INFO("HTTP server stopped");
    }

    void RegisterRoutes() {
        auto gateway = gateway_;
        auto reads = read_handlers_;

        server_->Post("/predict", [gateway](const httplib::Request& req, httplib::Response& res) {
            ApplyResponse(gateway->HandlePredict(FromHttplib(req)), res);
        });

        server_->Get("/health", [gateway](const httplib::Request& req, httplib::Response& res) {
            ApplyResponse(gateway->HandleHealth(FromHttplib(req)), res);
        });

        server_->Get("/metrics", [reads](const httplib::Request& req, httplib::Response& res) {
            ApplyResponse(reads->HandleMetrics(FromHttplib(req)), res);
        });

        server_->Get("/metrics/internal",
                     [reads](const httplib::Request& req, httplib::Response& res) {
            ApplyResponse(reads->HandleInternalMetrics(FromHttplib(req)), res);
        });

        server_->Get("/api/analytics/summary",
                     [reads](const httplib::Request& req, httplib::Response& res) {
            ApplyResponse(reads->HandleSummary(FromHttplib(req)), res);
        });

        server_->Get("/api/insights", [reads](const httplib::Request& req, httplib::Response& res) {
            ApplyResponse(reads->HandleInsights(FromHttplib(req)), res);
        });

        server_->Post("/api/insights/generate",
                      [reads](const httplib::Request& req, httplib::Response& res) {
            ApplyResponse(reads->HandleGenerateInsights(FromHttplib(req)), res);
        });

        // Stray exceptions become an opaque 500
        server_->set_exception_handler(
            [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
                try {
                    if (ep) {
                        std::rethrow_exception(ep);
                    }
                } catch (const std::exception& e) {
                    SUPPORTPULSE_LOG_ERROR("Unhandled error on {} {}: {}", req.method, req.path,
                                           e.what());
                } catch (...) {
                    SUPPORTPULSE_LOG_ERROR("Unhandled non-standard exception on {} {}",
                                           req.method, req.path);
                }
                ApplyResponse(HttpResponse::InternalError(), res);
            });

        // Unrouted paths and empty error bodies get a JSON error
        server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
            if (!res.body.empty()) {
                return;
            }
            if (res.status == 404) {
                ApplyResponse(HttpResponse::NotFound(absl::StrCat("No route for ", req.path)),
                              res);
            } else {
                ApplyResponse(HttpResponse::Error(res.status, "http_error",
                                                  "Request could not be processed"),
                              res);
            }
        });
    }

    std::shared_ptr<RequestGateway> gateway_;
    std::shared_ptr<ReadHandlers> read_handlers_;
    GatewayConfig config_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    int port_ = 0;
};

ApiServer::ApiServer(std::shared_ptr<RequestGateway> gateway,
                     std::shared_ptr<ReadHandlers> read_handlers,
                     GatewayConfig config)
    : impl_(std::make_unique<Impl>(std::move(gateway), std::move(read_handlers),
                                   std::move(config))) {}

ApiServer::~ApiServer() = default;

absl::Status ApiServer::Start() {
    return impl_->Start();
}

void ApiServer::Stop() {
    impl_->Stop();
}

int ApiServer::Port() const {
    return impl_->port_;
}

bool ApiServer::IsRunning() const {
    return impl_->running_.load();
}

}  // namespace supportpulse::gateway
