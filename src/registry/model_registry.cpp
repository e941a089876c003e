/// @file model_registry.cpp
/// @brief Model registry implementation

#include "registry/model_registry.h"

#include <algorithm>
#include <fstream>
#include <map>
#include <mutex>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "registry/lexicon_models.h"

namespace supportpulse::registry {

using json = nlohmann::json;

namespace {

/// Wraps a unit: converts exceptions and overruns into ScoringError
class GuardedScoringUnit : public ScoringUnit {
public:
    GuardedScoringUnit(std::unique_ptr<ScoringUnit> inner, std::chrono::milliseconds budget)
        : inner_(std::move(inner)), budget_(budget) {}

    absl::StatusOr<ModelScore> Score(std::string_view message, IssueType issue_type) override {
        calls_.fetch_add(1, std::memory_order_relaxed);
        SUPPORTPULSE_COUNTER("scoring_calls_total").Increment();

        const auto start = std::chrono::steady_clock::now();
        absl::StatusOr<ModelScore> result;
        try {
            result = inner_->Score(message, issue_type);
        } catch (const std::exception& e) {
            result = supportpulse::ScoringError(
                absl::StrCat("Model '", Descriptor().name, "' raised: ", e.what()));
        } catch (...) {
            result = supportpulse::ScoringError(absl::StrCat(
                "Model '", Descriptor().name, "' raised a non-standard exception"));
        }
        const auto elapsed = std::chrono::steady_clock::now() - start;

        if (result.ok() && elapsed > budget_) {
            budget_overruns_.fetch_add(1, std::memory_order_relaxed);
            SUPPORTPULSE_COUNTER("scoring_budget_overruns_total").Increment();
            result = supportpulse::ScoringError(absl::StrCat(
                "Model '", Descriptor().name, "' exceeded its time budget of ",
                budget_.count(), " ms"));
        } else if (result.ok() &&
                   (!(result->confidence >= 0.0) || result->confidence > 1.0)) {
            result = supportpulse::ScoringError(absl::StrCat(
                "Model '", Descriptor().name, "' returned confidence out of range"));
        } else if (!result.ok() && GetErrorCode(result.status()) != ErrorCode::kScoringError) {
            result = supportpulse::ScoringError(absl::StrCat(
                "Model '", Descriptor().name, "' failed: ", result.status().message()));
        }

        if (!result.ok()) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            SUPPORTPULSE_COUNTER("scoring_failures_total").Increment();
            SUPPORTPULSE_LOG_WARN("{}", result.status().message());
        }
        return result;
    }

    const ModelDescriptor& Descriptor() const override { return inner_->Descriptor(); }

    ScoringStats Stats() const {
        return ScoringStats{
            calls_.load(std::memory_order_relaxed),
            failures_.load(std::memory_order_relaxed),
            budget_overruns_.load(std::memory_order_relaxed),
        };
    }

private:
    std::unique_ptr<ScoringUnit> inner_;
    std::chrono::milliseconds budget_;
    std::atomic<int64_t> calls_{0};
    std::atomic<int64_t> failures_{0};
    std::atomic<int64_t> budget_overruns_{0};
};

absl::StatusOr<ModelDescriptor> ParseDescriptor(const json& artifact) {
    if (!artifact.is_object()) {
        return absl::InvalidArgumentError("Artifact must be a JSON object");
    }
    for (const char* field : {"name", "capability", "version", "family"}) {
        if (!artifact.contains(field) || !artifact[field].is_string()) {
            return absl::InvalidArgumentError(
                absl::StrCat("Artifact field '", field, "' must be a string"));
        }
    }

    ModelDescriptor descriptor;
    descriptor.name = artifact["name"].get<std::string>();
    descriptor.version = artifact["version"].get<std::string>();
    descriptor.family = artifact["family"].get<std::string>();

    auto capability = ParseCapability(artifact["capability"].get<std::string>());
    if (!capability) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Unknown capability '", artifact["capability"].get<std::string>(), "'"));
    }
    descriptor.capability = *capability;

    if (descriptor.name.empty() || descriptor.version.empty()) {
        return absl::InvalidArgumentError("Artifact name and version must not be empty");
    }
    return descriptor;
}

}  // namespace

int CompareVersions(std::string_view lhs, std::string_view rhs) {
    std::vector<std::string_view> left = absl::StrSplit(lhs, '.');
    std::vector<std::string_view> right = absl::StrSplit(rhs, '.');

    const size_t parts = std::max(left.size(), right.size());
    for (size_t i = 0; i < parts; ++i) {
        std::string_view a = i < left.size() ? left[i] : "0";
        std::string_view b = i < right.size() ? right[i] : "0";

        int64_t na = 0;
        int64_t nb = 0;
        if (absl::SimpleAtoi(a, &na) && absl::SimpleAtoi(b, &nb)) {
            if (na != nb) {
                return na < nb ? -1 : 1;
            }
        } else if (a != b) {
            return a < b ? -1 : 1;
        }
    }
    return 0;
}

RegistryConfig RegistryConfig::FromConfig(const Config& config) {
    RegistryConfig result;
    result.models_directory = config.GetString("models.directory", "");
    result.time_budget = std::chrono::milliseconds(
        config.GetInt("models.time_budget_ms", result.time_budget.count()));

    auto required = config.GetStringList("models.required");
    if (!required.empty()) {
        result.required.clear();
        for (const auto& name : required) {
            auto capability = ParseCapability(name);
            if (capability) {
                result.required.push_back(*capability);
            } else {
                SUPPORTPULSE_LOG_WARN("Ignoring unknown required capability '{}'", name);
            }
        }
    }
    return result;
}

// =============================================================================
// Implementation Class
// =============================================================================

class ModelRegistry::Impl {
public:
    explicit Impl(RegistryConfig config) : config_(std::move(config)) {}

    RegistryConfig config_;

    mutable std::shared_mutex mutex_;
    std::map<Capability, std::vector<std::shared_ptr<GuardedScoringUnit>>> units_;
};

ModelRegistry::ModelRegistry(RegistryConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

ModelRegistry::~ModelRegistry() = default;

absl::Status ModelRegistry::Initialize() {
    if (impl_->config_.models_directory.empty()) {
        SUPPORTPULSE_LOG_INFO("No model directory configured, using built-in models");
        return RegisterBuiltinModels();
    }

    auto loaded = LoadFromDirectory(impl_->config_.models_directory);
    if (!loaded.ok()) {
        return loaded.status();
    }
    SUPPORTPULSE_LOG_INFO("Loaded {} model artifact(s) from {}", *loaded,
                          impl_->config_.models_directory.string());

    auto missing = MissingCapabilities();
    for (Capability capability : missing) {
        SUPPORTPULSE_LOG_WARN("No model loaded for required capability '{}'",
                              CapabilityName(capability));
    }
    return absl::OkStatus();
}

absl::Status ModelRegistry::Register(std::unique_ptr<ScoringUnit> unit) {
    if (!unit) {
        return absl::InvalidArgumentError("Cannot register a null scoring unit");
    }

    const ModelDescriptor descriptor = unit->Descriptor();
    auto guarded = std::make_shared<GuardedScoringUnit>(std::move(unit),
                                                        impl_->config_.time_budget);

    std::unique_lock lock(impl_->mutex_);
    auto& slot = impl_->units_[descriptor.capability];
    for (const auto& existing : slot) {
        const auto& other = existing->Descriptor();
        if (other.name == descriptor.name && other.version == descriptor.version) {
            return absl::AlreadyExistsError(absl::StrCat(
                "Model '", descriptor.name, "' version ", descriptor.version,
                " is already registered"));
        }
    }
    slot.push_back(std::move(guarded));

    SUPPORTPULSE_LOG_DEBUG("Registered model '{}' v{} ({}, {})", descriptor.name,
                           descriptor.version, CapabilityName(descriptor.capability),
                           descriptor.family);
    return absl::OkStatus();
}

absl::Status ModelRegistry::RegisterArtifact(const json& artifact) {
    auto descriptor = ParseDescriptor(artifact);
    if (!descriptor.ok()) {
        return descriptor.status();
    }

    const json parameters = artifact.value("parameters", json::object());
    auto unit = CreateScoringUnit(std::move(*descriptor), parameters);
    if (!unit.ok()) {
        return unit.status();
    }
    return Register(std::move(*unit));
}

absl::StatusOr<size_t> ModelRegistry::LoadFromDirectory(const std::filesystem::path& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Model directory not found: ", directory.string()));
    }

    // Sorted so registration order does not depend on the filesystem
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Cannot list ", directory.string(), ": ", ec.message()));
    }
    std::sort(files.begin(), files.end());

    size_t registered = 0;
    for (const auto& file : files) {
        std::ifstream input(file);
        json artifact = json::parse(input, nullptr, /*allow_exceptions=*/false);
        if (artifact.is_discarded()) {
            SUPPORTPULSE_LOG_WARN("Skipping malformed model artifact {}", file.string());
            continue;
        }

        auto status = RegisterArtifact(artifact);
        if (!status.ok()) {
            SUPPORTPULSE_LOG_WARN("Skipping model artifact {}: {}", file.string(),
                                  status.message());
            continue;
        }
        ++registered;
    }
    SUPPORTPULSE_COUNTER("model_artifacts_loaded_total").Add(static_cast<int64_t>(registered));
    return registered;
}

absl::Status ModelRegistry::RegisterBuiltinModels() {
    for (const auto& artifact : BuiltinArtifacts()) {
        SUPPORTPULSE_RETURN_IF_ERROR(RegisterArtifact(artifact));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::shared_ptr<ScoringUnit>> ModelRegistry::Resolve(
    Capability capability, std::optional<std::string_view> version) const {
    std::shared_lock lock(impl_->mutex_);

    auto it = impl_->units_.find(capability);
    if (it == impl_->units_.end() || it->second.empty()) {
        return ModelUnavailableError(absl::StrCat(
            "No model loaded for capability '", CapabilityName(capability), "'"));
    }

    std::shared_ptr<GuardedScoringUnit> best;
    for (const auto& unit : it->second) {
        const auto& unit_version = unit->Descriptor().version;
        if (version.has_value()) {
            if (unit_version == *version) {
                return std::shared_ptr<ScoringUnit>(unit);
            }
            continue;
        }
        if (!best || CompareVersions(unit_version, best->Descriptor().version) > 0) {
            best = unit;
        }
    }

    if (!best) {
        return ModelUnavailableError(absl::StrCat(
            "No model loaded for capability '", CapabilityName(capability),
            "' at version ", *version));
    }
    return std::shared_ptr<ScoringUnit>(best);
}

std::vector<Capability> ModelRegistry::MissingCapabilities(
    const std::vector<Capability>& required) const {
    std::shared_lock lock(impl_->mutex_);
    std::vector<Capability> missing;
    for (Capability capability : required) {
        auto it = impl_->units_.find(capability);
        if (it == impl_->units_.end() || it->second.empty()) {
            missing.push_back(capability);
        }
    }
    return missing;
}

std::vector<Capability> ModelRegistry::MissingCapabilities() const {
    return MissingCapabilities(impl_->config_.required);
}

std::vector<ModelInfo> ModelRegistry::ListModels() const {
    std::shared_lock lock(impl_->mutex_);
    std::vector<ModelInfo> models;
    for (const auto& [capability, units] : impl_->units_) {
        for (const auto& unit : units) {
            models.push_back(ModelInfo{unit->Descriptor(), unit->Stats()});
        }
    }
    return models;
}

size_t ModelRegistry::Size() const {
    std::shared_lock lock(impl_->mutex_);
    size_t total = 0;
    for (const auto& [capability, units] : impl_->units_) {
        total += units.size();
    }
    return total;
}

}  // namespace supportpulse::registry
