#pragma once

/// @file csikit/utils/string_map.hpp
/// @brief Ordered string-to-string mapping used for secrets and volume metadata

#include <map>
#include <string>

CSIKIT_NAMESPACE_BEGIN

namespace utils {

using StringMap = std::map<std::string, std::string>;

}  // namespace utils

CSIKIT_NAMESPACE_END
