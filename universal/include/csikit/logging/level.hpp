#pragma once

/// @file csikit/logging/level.hpp
/// @brief Log levels

#include <string_view>

CSIKIT_NAMESPACE_BEGIN

namespace logging {

/// Log levels
enum class Level {
    kTrace = 0,
    kDebug = 1,
    kInfo = 2,
    kWarning = 3,
    kError = 4,
    kCritical = 5,
    kNone = 6
};

/// Converts lowercase level name to a corresponding Level, throws std::runtime_error if no matching log level found.
Level LevelFromString(std::string_view level_name);

std::string_view ToString(Level level);

}  // namespace logging

CSIKIT_NAMESPACE_END
