#pragma once

/// @file csikit/utils/assert.hpp
/// @brief Invariant checks that throw instead of terminating the process

#include <stdexcept>
#include <string_view>

CSIKIT_NAMESPACE_BEGIN

namespace utils {

/// Thrown by CSIKIT_INVARIANT when the checked condition does not hold
class InvariantError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace impl {

[[noreturn]] void InvariantFailed(
    std::string_view expr,
    std::string_view msg,
    const char* file,
    int line,
    const char* function
);

}  // namespace impl

}  // namespace utils

CSIKIT_NAMESPACE_END

/// @brief Logs the failed condition with @a message and throws utils::InvariantError
#define CSIKIT_INVARIANT(condition, message)                                                                   \
    do {                                                                                                       \
        if (!(condition)) {                                                                                    \
            ::CSIKIT_NAMESPACE::utils::impl::InvariantFailed(#condition, (message), __FILE__, __LINE__, __func__); \
        }                                                                                                      \
    } while (false)
