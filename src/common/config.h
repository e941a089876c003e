#pragma once

/// @file config.h
/// @brief SupportPulse configuration management (YAML file + environment)

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace supportpulse {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Hierarchical configuration backed by a YAML document
///
/// Keys use dot notation ("analytics.bucket_width_seconds"). Getters never
/// fail: a missing or mistyped key yields the supplied default.
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load the known SUPPORTPULSE_* environment overrides
    /// @param prefix Environment variable prefix
    static Config LoadFromEnvironment(std::string_view prefix = "SUPPORTPULSE_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings, empty if the key is missing
    std::vector<std::string> GetStringList(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

    const YAML::Node& GetNode() const { return root_; }

    /// @brief Export configuration to JSON (scalars are exported as strings)
    nlohmann::json ToJson() const;

private:
    YAML::Node root_ = YAML::Node(YAML::NodeType::Map);

    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Load a file (optional) and overlay the environment on top of it
absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "SUPPORTPULSE_");

}  // namespace supportpulse
