#pragma once

/// @file csikit/utils/log.hpp
/// @brief Helpers for putting potentially large strings into logs

#include <cstddef>
#include <string>
#include <string_view>

CSIKIT_NAMESPACE_BEGIN

namespace utils::log {

/// @brief Returns @a data unchanged if it fits into @a limit bytes, otherwise cuts it on a UTF-8 code point
/// boundary and appends a note with the original size. A zero @a limit means no limit.
std::string ToLimitedUtf8(std::string_view data, std::size_t limit);

}  // namespace utils::log

CSIKIT_NAMESPACE_END
