#include <csikit/utils/log.hpp>

#include <fmt/format.h>

CSIKIT_NAMESPACE_BEGIN

namespace utils::log {

namespace {

bool IsUtf8Continuation(char c) noexcept { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

}  // namespace

std::string ToLimitedUtf8(std::string_view data, std::size_t limit) {
    if (limit == 0 || data.size() <= limit) {
        return std::string{data};
    }

    auto cut = limit;
    while (cut > 0 && IsUtf8Continuation(data[cut])) {
        --cut;
    }
    return fmt::format("{}...(truncated, total {} bytes)", data.substr(0, cut), data.size());
}

}  // namespace utils::log

CSIKIT_NAMESPACE_END
