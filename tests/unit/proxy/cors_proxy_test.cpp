/// @file cors_proxy_test.cpp
/// @brief Tests for the CORS relay

#include <mutex>
#include <vector>

#include <gtest/gtest.h>

#include "proxy/cors_proxy.h"

namespace supportpulse::proxy {
namespace {

struct ForwardedCall {
    HttpMethod method;
    std::string path;
    std::string body;
    std::string content_type;
};

class FakeUpstream : public UpstreamClient {
public:
    absl::StatusOr<UpstreamResponse> Forward(HttpMethod method, const std::string& path,
                                             const std::string& body,
                                             const std::string& content_type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({method, path, body, content_type});
        if (!reachable_) {
            return absl::UnavailableError("connection refused");
        }
        return reply_;
    }

    void SetReply(int status, std::string body) {
        reply_.status_code = status;
        reply_.content_type = "application/json";
        reply_.body = std::move(body);
    }

    void SetReachable(bool reachable) { reachable_ = reachable; }

    std::vector<ForwardedCall> Calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::mutex mutex_;
    std::vector<ForwardedCall> calls_;
    UpstreamResponse reply_;
    bool reachable_ = true;
};

void ExpectCorsHeaders(const HttpResponse& response) {
    ASSERT_EQ(response.headers.count("Access-Control-Allow-Origin"), 1u);
    EXPECT_EQ(response.headers.at("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(response.headers.at("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
    EXPECT_EQ(response.headers.at("Access-Control-Allow-Headers"), "Content-Type");
}

class CorsProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        upstream_ = std::make_shared<FakeUpstream>();
        proxy_ = std::make_unique<CorsProxy>(ProxyConfig{}, upstream_);
    }

    static HttpRequest Request(HttpMethod method, std::string path, std::string body = "") {
        HttpRequest request;
        request.method = method;
        request.path = std::move(path);
        request.body = std::move(body);
        request.headers["content-type"] = "application/json";
        return request;
    }

    std::shared_ptr<FakeUpstream> upstream_;
    std::unique_ptr<CorsProxy> proxy_;
};

TEST_F(CorsProxyTest, RelaysPredictVerbatim) {
    const std::string reply = R"({"recommended_priority":"high"})";
    upstream_->SetReply(200, reply);

    const std::string body = R"({"message":"locked out","issue_type":"account_access"})";
    auto response = proxy_->Handle(Request(HttpMethod::kPost, "/predict", body));

    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body, reply);
    ExpectCorsHeaders(response);

    auto calls = upstream_->Calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].method, HttpMethod::kPost);
    EXPECT_EQ(calls[0].path, "/predict");
    EXPECT_EQ(calls[0].body, body);
    EXPECT_EQ(calls[0].content_type, "application/json");
}

TEST_F(CorsProxyTest, UpstreamErrorStatusPassesThrough) {
    const std::string reply = R"({"error_code":"invalid_issue_type","message":"bad"})";
    upstream_->SetReply(400, reply);

    auto response = proxy_->Handle(Request(HttpMethod::kPost, "/predict", "{}"));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(response.body, reply);
    ExpectCorsHeaders(response);
}

TEST_F(CorsProxyTest, HealthAcceptsGetAndPost) {
    upstream_->SetReply(200, R"({"status":"ok"})");

    EXPECT_EQ(proxy_->Handle(Request(HttpMethod::kGet, "/health")).status_code, 200);
    EXPECT_EQ(proxy_->Handle(Request(HttpMethod::kPost, "/health")).status_code, 200);

    auto calls = upstream_->Calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].method, HttpMethod::kGet);
    EXPECT_EQ(calls[1].method, HttpMethod::kPost);
}

TEST_F(CorsProxyTest, UnreachableUpstreamIs502) {
    upstream_->SetReachable(false);

    auto response = proxy_->Handle(Request(HttpMethod::kPost, "/predict", "{}"));
    EXPECT_EQ(response.status_code, 502);
    EXPECT_EQ(nlohmann::json::parse(response.body)["error_code"], "upstream_unreachable");
    ExpectCorsHeaders(response);
}

TEST_F(CorsProxyTest, UnknownRoutesAre404) {
    auto unknown = proxy_->Handle(Request(HttpMethod::kGet, "/admin"));
    EXPECT_EQ(unknown.status_code, 404);
    ExpectCorsHeaders(unknown);

    EXPECT_EQ(proxy_->Handle(Request(HttpMethod::kGet, "/predict")).status_code, 404);
    EXPECT_TRUE(upstream_->Calls().empty());
}

TEST_F(CorsProxyTest, PreflightAnsweredLocally) {
    auto response = proxy_->Handle(Request(HttpMethod::kOptions, "/predict"));
    EXPECT_EQ(response.status_code, 200);
    ExpectCorsHeaders(response);
    EXPECT_TRUE(upstream_->Calls().empty());
}

TEST(AddCorsHeadersTest, OverwritesExisting) {
    HttpResponse response;
    response.headers["Access-Control-Allow-Origin"] = "https://example.com";
    AddCorsHeaders(response);
    ExpectCorsHeaders(response);
}

TEST(ProxyConfigTest, FromConfig) {
    auto config = Config::LoadFromString(R"(
proxy:
  port: 9090
  upstream: http://gateway:8080
  timeout_ms: 2500
  threads: 0
)");
    ASSERT_TRUE(config.ok());

    auto result = ProxyConfig::FromConfig(*config);
    EXPECT_EQ(result.port, 9090);
    EXPECT_EQ(result.upstream, "http://gateway:8080");
    EXPECT_EQ(result.timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(result.threads, 4);
    EXPECT_EQ(result.host, "0.0.0.0");
}

}  // namespace
}  // namespace supportpulse::proxy
