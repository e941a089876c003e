/// @file escalation_action_test.cpp
/// @brief Tests for the escalation webhook action

#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "actions/action_manager.h"
#include "actions/escalation_action.h"

namespace supportpulse::actions {
namespace {

using json = nlohmann::json;

/// Webhook receiver on an ephemeral port
class FakeWebhook {
public:
    explicit FakeWebhook(int status) : status_(status) {
        server_.Post("/escalations", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                bodies_.push_back(req.body);
            }
            res.status = status_;
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~FakeWebhook() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string Url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<std::string> Bodies() {
        std::lock_guard<std::mutex> lock(mutex_);
        return bodies_;
    }

private:
    int status_;
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> bodies_;
};

inference::Prediction Escalated() {
    inference::Prediction prediction;
    prediction.message = "Locked out again, this is unacceptable";
    prediction.issue_type = IssueType::kAccountAccess;
    prediction.predicted_satisfaction = Level::kLow;
    prediction.recommended_priority = Level::kHigh;
    prediction.confidence = 0.6;
    prediction.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    return prediction;
}

EscalationConfig WebhookConfig(const std::string& url) {
    EscalationConfig config;
    config.webhook_url = url;
    config.timeout = std::chrono::milliseconds(2000);
    return config;
}

TEST(EscalationActionTest, FiresOnlyAtConfiguredPriority) {
    EscalationAction action;
    auto prediction = Escalated();
    EXPECT_TRUE(action.ShouldExecute(prediction));

    prediction.recommended_priority = Level::kMedium;
    EXPECT_FALSE(action.ShouldExecute(prediction));

    EscalationConfig config;
    config.min_priority = Level::kMedium;
    EXPECT_TRUE(EscalationAction(config).ShouldExecute(prediction));
}

TEST(EscalationActionTest, LogsWithoutWebhook) {
    EscalationAction action;
    EXPECT_TRUE(action.Execute(Escalated()).ok());
}

TEST(EscalationActionTest, PostsPredictionToWebhook) {
    FakeWebhook webhook(204);
    EscalationAction action(WebhookConfig(webhook.Url()));

    ASSERT_TRUE(action.Execute(Escalated()).ok());

    auto bodies = webhook.Bodies();
    ASSERT_EQ(bodies.size(), 1u);
    auto body = json::parse(bodies[0]);
    EXPECT_EQ(body["event"], "escalation");
    EXPECT_EQ(body["prediction"]["recommended_priority"], "high");
    EXPECT_EQ(body["prediction"]["issue_type"], "account_access");
    EXPECT_EQ(body["prediction"]["timestamp"], "2023-11-14T22:13:20.000Z");
}

TEST(EscalationActionTest, WebhookErrorStatusFails) {
    FakeWebhook webhook(500);
    EscalationAction action(WebhookConfig(webhook.Url()));

    auto status = action.Execute(Escalated());
    EXPECT_EQ(status.code(), absl::StatusCode::kUnavailable);
}

TEST(EscalationActionTest, UnreachableWebhookFails) {
    EscalationConfig config = WebhookConfig("http://127.0.0.1:1");
    config.timeout = std::chrono::milliseconds(500);
    EscalationAction action(config);

    EXPECT_EQ(action.Execute(Escalated()).code(), absl::StatusCode::kUnavailable);
}

TEST(EscalationActionTest, RunsThroughManager) {
    FakeWebhook webhook(200);
    ActionManager manager;
    ASSERT_TRUE(manager.Register(
        std::make_shared<EscalationAction>(WebhookConfig(webhook.Url())), 10).ok());

    auto report = manager.Run(Escalated());
    EXPECT_EQ(report.executed, (std::vector<std::string>{"escalation"}));
    EXPECT_EQ(webhook.Bodies().size(), 1u);
}

TEST(EscalationConfigTest, FromConfig) {
    auto config = Config::LoadFromString(R"(
actions:
  escalation:
    priority: 5
    min_priority: medium
    webhook_url: http://support-bot:9000
    webhook_path: /hooks/escalate
    timeout_ms: 750
)");
    ASSERT_TRUE(config.ok());

    auto result = EscalationConfig::FromConfig(*config);
    EXPECT_TRUE(result.enabled);
    EXPECT_EQ(result.priority, 5);
    EXPECT_EQ(result.min_priority, Level::kMedium);
    EXPECT_EQ(result.webhook_url, "http://support-bot:9000");
    EXPECT_EQ(result.webhook_path, "/hooks/escalate");
    EXPECT_EQ(result.timeout, std::chrono::milliseconds(750));
}

TEST(EscalationConfigTest, UnknownMinPriorityKeepsDefault) {
    auto config = Config::LoadFromString(R"(
actions:
  escalation:
    min_priority: urgent
)");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(EscalationConfig::FromConfig(*config).min_priority, Level::kHigh);
}

}  // namespace
}  // namespace supportpulse::actions
