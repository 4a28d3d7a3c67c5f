#include <csikit/config/config.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

CSIKIT_NAMESPACE_BEGIN

namespace config {

namespace {

template <typename T>
T GetValue(const YAML::Node& parent, std::string_view key, const T& dflt) {
    const auto node = parent[std::string{key}];
    if (!node || node.IsNull()) return dflt;
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(fmt::format("'{}' has an invalid value '{}'", key, node.Scalar()));
    }
}

std::string GetNonEmptyString(const YAML::Node& parent, std::string_view key, const std::string& dflt) {
    auto value = GetValue<std::string>(parent, key, dflt);
    if (value.empty()) throw ConfigError(fmt::format("'{}' must not be empty", key));
    return value;
}

LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
    LoggingConfig cfg;
    if (!node || node.IsNull()) return cfg;
    if (!node.IsMap()) throw ConfigError("'logging' must be a mapping");

    const auto level_name = GetValue<std::string>(node, "level", std::string{logging::ToString(cfg.level)});
    try {
        cfg.level = logging::LevelFromString(level_name);
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }

    const auto max_size = GetValue<long long>(node, "message-max-size", static_cast<long long>(cfg.message_max_size));
    if (max_size < 0) throw ConfigError("'message-max-size' must not be negative");
    cfg.message_max_size = static_cast<std::size_t>(max_size);

    cfg.trim_secrets = GetValue<bool>(node, "trim-secrets", cfg.trim_secrets);
    return cfg;
}

Config ParseConfig(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError("config root must be a mapping");

    cfg.plugin_name = GetNonEmptyString(root, "plugin-name", cfg.plugin_name);
    cfg.plugins_dir = GetNonEmptyString(root, "plugins-dir", cfg.plugins_dir);
    cfg.secrets_dir = GetNonEmptyString(root, "secrets-dir", cfg.secrets_dir);
    cfg.logging = ParseLoggingConfig(root["logging"]);
    return cfg;
}

}  // namespace

Config ParseConfigString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml});
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("failed to parse config: {}", e.what()));
    }
    return ParseConfig(root);
}

Config ParseConfigFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("failed to load config file '{}': {}", path, e.what()));
    }
    return ParseConfig(root);
}

}  // namespace config

CSIKIT_NAMESPACE_END
