/// @file config_test.cpp
/// @brief Tests for SupportPulse configuration management

#include <gtest/gtest.h>

#include <cstdlib>

#include "common/config.h"

namespace supportpulse {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
gateway:
  port: 8080
  max_message_length: 5000
models:
  required:
    - intent
    - sentiment
orchestrator:
  satisfaction_threshold: 0.65
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetInt("gateway.port"), 8080);
    EXPECT_EQ(config.GetInt("gateway.max_message_length"), 5000);
    EXPECT_DOUBLE_EQ(config.GetDouble("orchestrator.satisfaction_threshold"), 0.65);
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto required = config.GetStringList("models.required");
    ASSERT_EQ(required.size(), 2);
    EXPECT_EQ(required[0], "intent");
    EXPECT_EQ(required[1], "sentiment");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
    EXPECT_TRUE(config.GetStringList("nonexistent.key").empty());
}

TEST(ConfigTest, MistypedValueFallsBackToDefault) {
    auto result = Config::LoadFromString("gateway:\n  port: eighty\n");
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result->GetInt("gateway.port", 8080), 8080);
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("proxy.upstream", std::string("http://api:8080"));
    config.Set("proxy.port", static_cast<int64_t>(9001));
    config.Set("insights.enabled", false);
    config.Set("models.required", std::vector<std::string>{"intent"});

    EXPECT_EQ(config.GetString("proxy.upstream"), "http://api:8080");
    EXPECT_EQ(config.GetInt("proxy.port"), 9001);
    EXPECT_FALSE(config.GetBool("insights.enabled", true));
    EXPECT_EQ(config.GetStringList("models.required"), std::vector<std::string>{"intent"});
}

TEST(ConfigTest, HasKey) {
    auto result = Config::LoadFromString("analytics:\n  retention_seconds: 600\n");
    ASSERT_TRUE(result.ok());

    EXPECT_TRUE(result->HasKey("analytics.retention_seconds"));
    EXPECT_FALSE(result->HasKey("analytics.bucket_width_seconds"));
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
gateway:
  host: 0.0.0.0
  port: 8080
insights:
  enabled: true
)";

    const std::string overlay_yaml = R"(
gateway:
  port: 9090
proxy:
  port: 9091
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    base.Merge(*overlay_result);

    EXPECT_EQ(base.GetString("gateway.host"), "0.0.0.0");
    EXPECT_EQ(base.GetInt("gateway.port"), 9090);
    EXPECT_EQ(base.GetInt("proxy.port"), 9091);
    EXPECT_TRUE(base.GetBool("insights.enabled"));
}

TEST(ConfigTest, EnvironmentOverrides) {
    ::setenv("SPTEST_HTTP_PORT", "9123", 1);
    ::setenv("SPTEST_OLLAMA_URL", "http://ollama:11434", 1);
    ::setenv("SPTEST_REQUIRED_CAPABILITIES", "intent, sentiment", 1);
    ::setenv("SPTEST_RETENTION_SECONDS", "not-a-number", 1);

    Config config = Config::LoadFromEnvironment("SPTEST_");

    EXPECT_EQ(config.GetInt("gateway.port"), 9123);
    EXPECT_EQ(config.GetString("insights.backend_url"), "http://ollama:11434");
    EXPECT_EQ(config.GetStringList("models.required"),
              (std::vector<std::string>{"intent", "sentiment"}));
    EXPECT_FALSE(config.HasKey("analytics.retention_seconds"));

    ::unsetenv("SPTEST_HTTP_PORT");
    ::unsetenv("SPTEST_OLLAMA_URL");
    ::unsetenv("SPTEST_REQUIRED_CAPABILITIES");
    ::unsetenv("SPTEST_RETENTION_SECONDS");
}

TEST(ConfigTest, LoadConfigWithoutFileUsesEnvironment) {
    ::setenv("SPTEST2_PROXY_PORT", "7001", 1);

    auto result = LoadConfig(std::nullopt, "SPTEST2_");
    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_EQ(result->GetInt("proxy.port"), 7001);

    ::unsetenv("SPTEST2_PROXY_PORT");
}

TEST(ConfigTest, MissingFileIsAnError) {
    auto result = Config::LoadFromFile("/nonexistent/supportpulse.yaml");
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, InvalidYaml) {
    auto result = Config::LoadFromString("{ invalid yaml [");
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, ToJson) {
    auto result = Config::LoadFromString("gateway:\n  port: 8080\n");
    ASSERT_TRUE(result.ok());

    auto json = result->ToJson();
    ASSERT_TRUE(json.contains("gateway"));
    EXPECT_EQ(json["gateway"]["port"], "8080");
}

}  // namespace
}  // namespace supportpulse
