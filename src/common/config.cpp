#include "config.h"

#include <cstdlib>
#include <functional>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace supportpulse {

namespace {

/// Environment suffix -> configuration key and value kind
struct EnvBinding {
    const char* suffix;
    const char* key;
    enum class Kind { kString, kInt, kDouble, kBool, kList } kind;
};

constexpr EnvBinding kEnvBindings[] = {
    {"HTTP_HOST", "gateway.host", EnvBinding::Kind::kString},
    {"HTTP_PORT", "gateway.port", EnvBinding::Kind::kInt},
    {"HTTP_THREADS", "gateway.threads", EnvBinding::Kind::kInt},
    {"MODELS_DIR", "models.directory", EnvBinding::Kind::kString},
    {"REQUIRED_CAPABILITIES", "models.required", EnvBinding::Kind::kList},
    {"SATISFACTION_THRESHOLD", "orchestrator.satisfaction_threshold", EnvBinding::Kind::kDouble},
    {"BUCKET_WIDTH_SECONDS", "analytics.bucket_width_seconds", EnvBinding::Kind::kInt},
    {"RETENTION_SECONDS", "analytics.retention_seconds", EnvBinding::Kind::kInt},
    {"OLLAMA_URL", "insights.backend_url", EnvBinding::Kind::kString},
    {"OLLAMA_MODEL", "insights.model", EnvBinding::Kind::kString},
    {"INSIGHTS_ENABLED", "insights.enabled", EnvBinding::Kind::kBool},
    {"INSIGHTS_INTERVAL_SECONDS", "insights.interval_seconds", EnvBinding::Kind::kInt},
    {"INSIGHTS_TIMEOUT_MS", "insights.timeout_ms", EnvBinding::Kind::kInt},
    {"PROXY_PORT", "proxy.port", EnvBinding::Kind::kInt},
    {"PROXY_UPSTREAM", "proxy.upstream", EnvBinding::Kind::kString},
    {"LOG_LEVEL", "logging.level", EnvBinding::Kind::kString},
    {"LOG_FILE", "logging.file", EnvBinding::Kind::kString},
};

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        YAML::Node loaded = YAML::LoadFile(path.string());
        if (loaded.IsMap()) {
            config.root_ = loaded;
        } else if (!loaded.IsNull()) {
            return absl::InvalidArgumentError(
                absl::StrCat("Configuration root must be a map: ", path.string()));
        }
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        YAML::Node loaded = YAML::Load(std::string(yaml_content));
        if (loaded.IsMap()) {
            config.root_ = loaded;
        } else if (!loaded.IsNull()) {
            return absl::InvalidArgumentError("Configuration root must be a map");
        }
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        const std::string name = absl::StrCat(prefix, binding.suffix);
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }
        const std::string value(raw);

        switch (binding.kind) {
            case EnvBinding::Kind::kString:
                config.Set(binding.key, value);
                break;
            case EnvBinding::Kind::kInt: {
                int64_t parsed = 0;
                if (absl::SimpleAtoi(value, &parsed)) {
                    config.Set(binding.key, parsed);
                } else {
                    SUPPORTPULSE_LOG_WARN("Ignoring {}: '{}' is not an integer", name, value);
                }
                break;
            }
            case EnvBinding::Kind::kDouble: {
                double parsed = 0.0;
                if (absl::SimpleAtod(value, &parsed)) {
                    config.Set(binding.key, parsed);
                } else {
                    SUPPORTPULSE_LOG_WARN("Ignoring {}: '{}' is not a number", name, value);
                }
                break;
            }
            case EnvBinding::Kind::kBool: {
                bool parsed = false;
                if (absl::SimpleAtob(value, &parsed)) {
                    config.Set(binding.key, parsed);
                } else {
                    SUPPORTPULSE_LOG_WARN("Ignoring {}: '{}' is not a boolean", name, value);
                }
                break;
            }
            case EnvBinding::Kind::kList: {
                std::vector<std::string> items = absl::StrSplit(value, ',', absl::SkipWhitespace());
                for (auto& item : items) {
                    item = std::string(absl::StripAsciiWhitespace(item));
                }
                config.Set(binding.key, std::move(items));
                break;
            }
        }
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    // reset() rebinds the handle; operator= would overwrite the tree node
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& lookup = current;
        YAML::Node next = lookup[part];
        if (!next) {
            return std::nullopt;
        }
        current.reset(next);
    }

    if (current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    std::function<nlohmann::json(const YAML::Node&)> convert;
    convert = [&convert](const YAML::Node& node) -> nlohmann::json {
        if (node.IsMap()) {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = convert(kv.second);
            }
            return object;
        }
        if (node.IsSequence()) {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(convert(item));
            }
            return array;
        }
        if (node.IsScalar()) {
            return node.as<std::string>();
        }
        return nullptr;
    };
    return convert(root_);
}

absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment has the highest priority
    config.Merge(Config::LoadFromEnvironment(env_prefix));
    return config;
}

}  // namespace supportpulse
