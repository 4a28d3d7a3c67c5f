#include <csikit/utils/assert.hpp>

#include <fmt/format.h>

#include <csikit/logging/log.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace utils::impl {

void InvariantFailed(std::string_view expr, std::string_view msg, const char* file, int line, const char* function) {
    auto what = fmt::format("{}:{}:{}: invariant ({}) violation: {}", file, line, function, expr, msg);
    LOG_ERROR() << what;
    throw InvariantError(what);
}

}  // namespace utils::impl

CSIKIT_NAMESPACE_END
