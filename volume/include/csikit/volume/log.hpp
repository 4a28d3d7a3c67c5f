#pragma once

/// @file csikit/volume/log.hpp
/// @brief Plugin-prefixed log messages

#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

inline constexpr std::string_view kCsiPluginName = "kubernetes.io/csi";

/// Formats a message and prepends it with `kubernetes.io/csi: `
template <typename... Args>
std::string LogMsg(fmt::format_string<Args...> format, Args&&... args) {
    return fmt::format("{}: {}", kCsiPluginName, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace volume

CSIKIT_NAMESPACE_END
