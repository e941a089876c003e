#pragma once

/// @file model_registry.h
/// @brief Lookup of versioned scoring units by capability

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "registry/scoring_unit.h"

namespace supportpulse::registry {

/// @brief Registry configuration
struct RegistryConfig {
    /// Directory with *.json artifacts; empty means built-in models
    std::filesystem::path models_directory;

    /// Per-call time budget of a scoring unit. Units are synchronous, so an
    /// overrun is detected once Score() returns and its result discarded;
    /// a unit that never returns is not interrupted.
    std::chrono::milliseconds time_budget{250};

    /// Capabilities reported as missing by /health when not loaded
    std::vector<Capability> required = {
        Capability::kIntent, Capability::kSentiment, Capability::kResponseTemplate};

    /// Read the `models.*` section
    static RegistryConfig FromConfig(const Config& config);
};

/// @brief Per-unit call statistics
struct ScoringStats {
    int64_t calls = 0;
    int64_t failures = 0;
    int64_t budget_overruns = 0;
};

/// @brief Loaded model with its statistics
struct ModelInfo {
    ModelDescriptor descriptor;
    ScoringStats stats;
};

/// @brief Compare dot-separated versions numerically ("1.10.0" > "1.2.0")
/// @return negative, zero or positive like strcmp
int CompareVersions(std::string_view lhs, std::string_view rhs);

/// @brief Registry of scoring units
///
/// Every registered unit is wrapped so that exceptions of any type and time
/// budget overruns come back as ScoringError statuses. The budget is checked
/// after the call, not enforced by preemption. Resolve() hands out shared
/// handles, so a unit stays alive for callers even if it is replaced.
class ModelRegistry {
public:
    explicit ModelRegistry(RegistryConfig config = {});
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    /// @brief Load the configured directory, or the built-in models if none
    absl::Status Initialize();

    /// @brief Register a unit; fails if the same name and version exist
    absl::Status Register(std::unique_ptr<ScoringUnit> unit);

    /// @brief Build and register a unit from an artifact document
    absl::Status RegisterArtifact(const nlohmann::json& artifact);

    /// @brief Register every valid *.json artifact of a directory
    /// @return Number of artifacts registered; malformed ones are logged and skipped
    absl::StatusOr<size_t> LoadFromDirectory(const std::filesystem::path& directory);

    /// @brief Register the built-in default artifacts
    absl::Status RegisterBuiltinModels();

    /// @brief Resolve a unit by capability, highest version unless one is pinned
    /// @return ModelUnavailable if nothing matches
    absl::StatusOr<std::shared_ptr<ScoringUnit>> Resolve(
        Capability capability,
        std::optional<std::string_view> version = std::nullopt) const;

    /// @brief Required capabilities with no loaded artifact
    std::vector<Capability> MissingCapabilities(const std::vector<Capability>& required) const;

    /// @brief MissingCapabilities() for the configured requirement
    std::vector<Capability> MissingCapabilities() const;

    std::vector<ModelInfo> ListModels() const;

    size_t Size() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace supportpulse::registry
