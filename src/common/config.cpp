#include "common/config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"
#include "common/logging.h"

namespace flaresignal {

namespace {

Config g_global_config;

nlohmann::json NodeToJson(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return nullptr;
    }
    if (node.IsMap()) {
        nlohmann::json object = nlohmann::json::object();
        for (const auto& kv : node) {
            object[kv.first.as<std::string>()] = NodeToJson(kv.second);
        }
        return object;
    }
    if (node.IsSequence()) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : node) {
            array.push_back(NodeToJson(item));
        }
        return array;
    }

    // Scalars keep their most specific type
    const std::string scalar = node.Scalar();
    int64_t as_int = 0;
    double as_double = 0.0;
    if (absl::SimpleAtoi(scalar, &as_int)) {
        return as_int;
    }
    if (absl::SimpleAtod(scalar, &as_double)) {
        return as_double;
    }
    if (scalar == "true" || scalar == "false") {
        return scalar == "true";
    }
    return scalar;
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return MakeError(ErrorCode::kNotFound,
                         absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = std::string(prefix) + suffix;
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    if (auto val = get_env("FLARE_MARGIN")) {
        double margin = 0.0;
        if (absl::SimpleAtod(*val, &margin)) {
            config.Set("flare.threshold_margin", margin);
        } else {
            FLARESIGNAL_LOG_WARN("Ignoring non-numeric {}FLARE_MARGIN='{}'", prefix, *val);
        }
    }

    if (auto val = get_env("FLARE_BASELINE_WINDOW_DAYS")) {
        int64_t days = 0;
        if (absl::SimpleAtoi(*val, &days)) {
            config.Set("flare.baseline_window_days", days);
        } else {
            FLARESIGNAL_LOG_WARN("Ignoring non-integer {}FLARE_BASELINE_WINDOW_DAYS='{}'",
                                 prefix, *val);
        }
    }

    if (auto val = get_env("CORRELATION_PERIOD_DAYS")) {
        int64_t days = 0;
        if (absl::SimpleAtoi(*val, &days)) {
            config.Set("correlation.period_days", days);
        } else {
            FLARESIGNAL_LOG_WARN("Ignoring non-integer {}CORRELATION_PERIOD_DAYS='{}'",
                                 prefix, *val);
        }
    }

    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (overlay.IsMap()) {
            for (const auto& kv : overlay) {
                const std::string key = kv.first.as<std::string>();
                if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                    YAML::Node base_child = base[key];
                    merge_nodes(base_child, kv.second);
                } else {
                    base[key] = kv.second;
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    YAML::Node current = root_;

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        // Const lookup and reset() so that a miss never inserts into root_
        const YAML::Node& view = current;
        current.reset(view[part]);
    }

    if (!current || current.IsNull()) {
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
        } catch (const YAML::BadConversion& e) {
            FLARESIGNAL_LOG_WARN("Config key '{}' is not an integer: {}", key, e.what());
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
        } catch (const YAML::BadConversion& e) {
            FLARESIGNAL_LOG_WARN("Config key '{}' is not a number: {}", key, e.what());
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
        } catch (const YAML::BadConversion& e) {
            FLARESIGNAL_LOG_WARN("Config key '{}' is not a boolean: {}", key, e.what());
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
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // yaml-cpp nodes are handles, so writing through a copy updates root_
    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(current[parts[i]]);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            current[parts.back()] = map;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

Config& GlobalConfig() {
    return g_global_config;
}

absl::Status InitGlobalConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix
) {
    g_global_config = Config();

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        g_global_config.Merge(*file_config);
    }

    // Environment variables have the highest priority
    Config env_config = Config::LoadFromEnvironment(env_prefix);
    g_global_config.Merge(env_config);

    return absl::OkStatus();
}

}  // namespace flaresignal
