#pragma once

/// @file csikit/protobuf/logging.hpp
/// @brief Text form of protocol messages for logs

#include <cstddef>
#include <string>
#include <string_view>

#include <google/protobuf/message.h>

#include <csikit/config/config.hpp>
#include <csikit/logging/level.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace protobuf {

/// Returned instead of a message whose secrets could not be redacted
inline constexpr std::string_view kUnsanitizablePlaceholder = "hidden: message could not be sanitized";

struct MessageLoggingOptions {
    logging::Level log_level{logging::Level::kDebug};
    /// 0 disables truncation
    std::size_t max_size{512};
    bool trim_secrets{true};
};

MessageLoggingOptions MakeMessageLoggingOptions(const config::LoggingConfig& config, logging::Level log_level);

/// @brief Renders @a message for a log record written at `options.log_level`.
///
/// Sensitive fields are redacted at any depth: in the message itself, in nested messages, in repeated messages and
/// in map values. If redaction or rendering fails the original is never returned, @ref kUnsanitizablePlaceholder
/// is returned instead.
std::string GetMessageForLogging(const google::protobuf::Message& message, MessageLoggingOptions options = {});

}  // namespace protobuf

CSIKIT_NAMESPACE_END
