#include <csikit/logging/level.hpp>

#include <array>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

CSIKIT_NAMESPACE_BEGIN

namespace logging {

namespace {

constexpr std::array<std::pair<std::string_view, Level>, 7> kLevelNames{{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"none", Level::kNone},
}};

}  // namespace

Level LevelFromString(std::string_view level_name) {
    for (const auto& [name, level] : kLevelNames) {
        if (name == level_name) return level;
    }
    throw std::runtime_error(fmt::format(
        "Unknown log level '{}' (must be one of 'trace', 'debug', 'info', 'warning', 'error', 'critical', 'none')",
        level_name
    ));
}

std::string_view ToString(Level level) {
    for (const auto& [name, value] : kLevelNames) {
        if (value == level) return name;
    }
    return "unknown";
}

}  // namespace logging

CSIKIT_NAMESPACE_END
