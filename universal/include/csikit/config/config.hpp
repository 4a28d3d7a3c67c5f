#pragma once

/// @file csikit/config/config.hpp
/// @brief Static configuration of the csikit runtime support layer
///
/// Example:
/// @code{.yaml}
/// plugin-name: kubernetes.io/csi
/// plugins-dir: /var/lib/kubelet/plugins
/// secrets-dir: /var/run/secrets/csi
/// logging:
///   level: info
///   message-max-size: 512
///   trim-secrets: true
/// @endcode

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include <csikit/logging/level.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace config {

/// Thrown on unreadable or invalid configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LoggingConfig {
    logging::Level level{logging::Level::kInfo};
    /// Protocol messages longer than this are truncated in logs, 0 disables truncation
    std::size_t message_max_size{512};
    bool trim_secrets{true};
};

struct Config {
    std::string plugin_name{"kubernetes.io/csi"};
    std::string plugins_dir{"/var/lib/kubelet/plugins"};
    std::string secrets_dir{"/var/run/secrets/csi"};
    LoggingConfig logging;
};

/// @throws ConfigError if @a yaml is not a valid YAML mapping or holds invalid values
Config ParseConfigString(std::string_view yaml);

/// @throws ConfigError if the file can not be read or holds an invalid config
Config ParseConfigFile(const std::string& path);

}  // namespace config

CSIKIT_NAMESPACE_END
