#include <csikit/protobuf/logging.hpp>

#include <memory>

#include <csikit/logging/log.hpp>
#include <csikit/protobuf/sanitize.hpp>
#include <csikit/utils/assert.hpp>
#include <csikit/utils/log.hpp>

#include <protobuf/impl/redact.hpp>
#include <protobuf/impl/sensitive_fields.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace protobuf {

namespace {

std::string ToLimitedString(const google::protobuf::Message& message, std::size_t max_size) {
    return utils::log::ToLimitedUtf8(impl::Render(message), max_size);
}

std::string DoGetMessageForLogging(const google::protobuf::Message& message, MessageLoggingOptions options) {
    if (!options.trim_secrets || !impl::ContainsSensitiveFields(*message.GetDescriptor())) {
        return ToLimitedString(message, options.max_size);
    }

    const std::unique_ptr<google::protobuf::Message> trimmed{message.New()};
    trimmed->CopyFrom(message);
    if (const auto failure = impl::RedactRecursive(*trimmed)) {
        LOG_WARNING() << "Failed to sanitize " << message.GetTypeName() << " for logging: " << ToString(failure->error)
                      << " in field " << failure->field;
        return std::string{kUnsanitizablePlaceholder};
    }
    return ToLimitedString(*trimmed, options.max_size);
}

}  // namespace

MessageLoggingOptions MakeMessageLoggingOptions(const config::LoggingConfig& config, logging::Level log_level) {
    return MessageLoggingOptions{log_level, config.message_max_size, config.trim_secrets};
}

std::string GetMessageForLogging(const google::protobuf::Message& message, MessageLoggingOptions options) {
    if (!logging::ShouldLog(options.log_level)) {
        return "hidden by log level";
    }

    try {
        return DoGetMessageForLogging(message, options);
    } catch (const utils::InvariantError&) {
        LOG_WARNING() << "Failed to render " << message.GetTypeName() << " for logging";
        return std::string{kUnsanitizablePlaceholder};
    }
}

}  // namespace protobuf

CSIKIT_NAMESPACE_END
