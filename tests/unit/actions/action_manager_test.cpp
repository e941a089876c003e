/// @file action_manager_test.cpp
/// @brief Tests for the post-prediction action pipeline

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "actions/action_manager.h"

namespace supportpulse::actions {
namespace {

/// Action whose predicate and body are supplied by the test
class ScriptedAction : public Action {
public:
    using ExecuteFn = std::function<absl::Status()>;
    using PredicateFn = std::function<bool(const inference::Prediction&)>;

    ScriptedAction(std::string name, std::vector<std::string>* order, std::mutex* order_mutex,
                   ExecuteFn execute = nullptr, PredicateFn predicate = nullptr)
        : name_(std::move(name)),
          order_(order),
          order_mutex_(order_mutex),
          execute_(std::move(execute)),
          predicate_(std::move(predicate)) {}

    std::string Name() const override { return name_; }

    bool ShouldExecute(const inference::Prediction& prediction) const override {
        return predicate_ ? predicate_(prediction) : true;
    }

    absl::Status Execute(const inference::Prediction& /*prediction*/) override {
        {
            std::lock_guard<std::mutex> lock(*order_mutex_);
            order_->push_back(name_);
        }
        return execute_ ? execute_() : absl::OkStatus();
    }

private:
    std::string name_;
    std::vector<std::string>* order_;
    std::mutex* order_mutex_;
    ExecuteFn execute_;
    PredicateFn predicate_;
};

class ActionManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedAction> MakeAction(std::string name,
                                               ScriptedAction::ExecuteFn execute = nullptr,
                                               ScriptedAction::PredicateFn predicate = nullptr) {
        return std::make_shared<ScriptedAction>(std::move(name), &order_, &order_mutex_,
                                                std::move(execute), std::move(predicate));
    }

    std::vector<std::string> Order() {
        std::lock_guard<std::mutex> lock(order_mutex_);
        return order_;
    }

    static inference::Prediction MakePrediction(Level priority) {
        inference::Prediction prediction;
        prediction.message = "I was charged twice";
        prediction.issue_type = IssueType::kBilling;
        prediction.recommended_priority = priority;
        prediction.predicted_satisfaction = Level::kLow;
        prediction.confidence = 0.7;
        prediction.timestamp = std::chrono::system_clock::now();
        return prediction;
    }

    std::mutex order_mutex_;
    std::vector<std::string> order_;
};

TEST_F(ActionManagerTest, RunsInPriorityOrder) {
    ActionManager manager;
    ASSERT_TRUE(manager.Register(MakeAction("audit"), 100).ok());
    ASSERT_TRUE(manager.Register(MakeAction("escalation"), 10).ok());
    ASSERT_TRUE(manager.Register(MakeAction("tagging"), 50).ok());

    auto report = manager.Run(MakePrediction(Level::kHigh));

    EXPECT_EQ(report.executed, (std::vector<std::string>{"escalation", "tagging", "audit"}));
    EXPECT_EQ(Order(), report.executed);
    EXPECT_TRUE(report.failed.empty());

    auto listed = manager.ListActions();
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0].name, "escalation");
    EXPECT_EQ(listed[2].priority, 100);
}

TEST_F(ActionManagerTest, RegistrationErrors) {
    ActionManager manager;
    EXPECT_EQ(manager.Register(nullptr, 1).code(), absl::StatusCode::kInvalidArgument);
    ASSERT_TRUE(manager.Register(MakeAction("audit"), 1).ok());
    EXPECT_EQ(manager.Register(MakeAction("audit"), 2).code(), absl::StatusCode::kAlreadyExists);
}

TEST_F(ActionManagerTest, SkipsDisabledAndNotApplicable) {
    ActionManager manager;
    ASSERT_TRUE(manager.Register(MakeAction("muted"), 1, /*enabled=*/false).ok());
    ASSERT_TRUE(manager.Register(
        MakeAction("urgent_only", nullptr,
                   [](const inference::Prediction& p) {
                       return p.recommended_priority == Level::kHigh;
                   }),
        2).ok());

    auto report = manager.Run(MakePrediction(Level::kMedium));

    EXPECT_TRUE(report.executed.empty());
    ASSERT_EQ(report.skipped.size(), 2u);
    EXPECT_EQ(report.skipped[0].action, "muted");
    EXPECT_EQ(report.skipped[0].reason, "disabled");
    EXPECT_EQ(report.skipped[1].action, "urgent_only");
    EXPECT_EQ(report.skipped[1].reason, "conditions_not_met");
    EXPECT_TRUE(Order().empty());
}

TEST_F(ActionManagerTest, FailuresAreRecordedAndContained) {
    ActionManager manager;
    ASSERT_TRUE(manager.Register(
        MakeAction("rejecting", [] { return absl::UnavailableError("webhook down"); }), 1).ok());
    ASSERT_TRUE(manager.Register(
        MakeAction("throwing", []() -> absl::Status { throw std::runtime_error("boom"); }),
        2).ok());
    ASSERT_TRUE(manager.Register(
        MakeAction("foreign", []() -> absl::Status { throw 7; }), 3).ok());
    ASSERT_TRUE(manager.Register(
        MakeAction("bad_predicate", nullptr,
                   [](const inference::Prediction&) -> bool {
                       throw std::logic_error("no rule");
                   }),
        4).ok());
    ASSERT_TRUE(manager.Register(MakeAction("audit"), 5).ok());

    ActionReport report;
    EXPECT_NO_THROW(report = manager.Run(MakePrediction(Level::kHigh)));

    ASSERT_EQ(report.failed.size(), 4u);
    EXPECT_EQ(report.failed[0].action, "rejecting");
    EXPECT_EQ(report.failed[0].error, "webhook down");
    EXPECT_EQ(report.failed[0].phase, "execution");
    EXPECT_EQ(report.failed[1].action, "throwing");
    EXPECT_EQ(report.failed[2].action, "foreign");
    EXPECT_EQ(report.failed[3].action, "bad_predicate");
    EXPECT_EQ(report.failed[3].phase, "should_execute");
    EXPECT_EQ(report.executed, (std::vector<std::string>{"audit"}));

    EXPECT_EQ(manager.GetStats().failed, 4);
    EXPECT_EQ(manager.GetStats().executed, 1);
}

TEST_F(ActionManagerTest, StopsAfterFailureWhenConfigured) {
    ActionsConfig config;
    config.continue_on_failure = false;
    ActionManager manager(config);
    ASSERT_TRUE(manager.Register(
        MakeAction("first", [] { return absl::InternalError("nope"); }), 1).ok());
    ASSERT_TRUE(manager.Register(MakeAction("second"), 2).ok());

    auto report = manager.Run(MakePrediction(Level::kHigh));

    ASSERT_EQ(report.failed.size(), 1u);
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].action, "second");
    EXPECT_EQ(report.skipped[0].reason, "aborted");
    EXPECT_EQ(Order(), (std::vector<std::string>{"first"}));
}

TEST_F(ActionManagerTest, SlowActionTimesOut) {
    ActionsConfig config;
    config.timeout = std::chrono::milliseconds(50);
    ActionManager manager(config);

    auto release = std::make_shared<std::atomic<bool>>(false);
    ASSERT_TRUE(manager.Register(MakeAction("slow", [release] {
        for (int i = 0; i < 200 && !release->load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return absl::OkStatus();
    }), 1).ok());
    ASSERT_TRUE(manager.Register(MakeAction("fast"), 2).ok());

    const auto start = std::chrono::steady_clock::now();
    auto report = manager.Run(MakePrediction(Level::kHigh));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    release->store(true);

    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].action, "slow");
    EXPECT_EQ(report.failed[0].error, "timeout");
    EXPECT_EQ(report.executed, (std::vector<std::string>{"fast"}));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(manager.GetStats().timeouts, 1);
}

TEST_F(ActionManagerTest, DispatchRunsInBackground) {
    ActionManager manager;
    ASSERT_TRUE(manager.Register(MakeAction("audit"), 1).ok());

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(manager.Dispatch(MakePrediction(Level::kLow)).ok());
    }
    manager.Flush();

    EXPECT_EQ(Order().size(), 5u);
    EXPECT_EQ(manager.GetStats().dispatched, 5);
    EXPECT_EQ(manager.GetStats().executed, 5);
}

TEST_F(ActionManagerTest, DispatchAfterShutdownIsRejected) {
    ActionManager manager;
    manager.Shutdown();

    auto status = manager.Dispatch(MakePrediction(Level::kHigh));
    EXPECT_EQ(status.code(), absl::StatusCode::kUnavailable);
}

TEST(ActionReportTest, Json) {
    ActionReport report;
    report.executed = {"escalation"};
    report.skipped.push_back({"audit", "disabled"});
    report.failed.push_back({"webhook", "timeout", "execution"});

    auto json = ToJson(report);
    EXPECT_EQ(json["executed"][0], "escalation");
    EXPECT_EQ(json["skipped"][0]["reason"], "disabled");
    EXPECT_EQ(json["failed"][0]["phase"], "execution");
}

TEST(ActionsConfigTest, FromConfig) {
    auto config = Config::LoadFromString(R"(
actions:
  enabled: false
  threads: 4
  max_queue: 0
  timeout_ms: 250
  continue_on_failure: false
)");
    ASSERT_TRUE(config.ok());

    auto result = ActionsConfig::FromConfig(*config);
    EXPECT_FALSE(result.enabled);
    EXPECT_EQ(result.threads, 4u);
    EXPECT_EQ(result.max_queue, 1000u);
    EXPECT_EQ(result.timeout, std::chrono::milliseconds(250));
    EXPECT_FALSE(result.continue_on_failure);
}

}  // namespace
}  // namespace supportpulse::actions
