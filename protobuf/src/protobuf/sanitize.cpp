#include <csikit/protobuf/sanitize.hpp>

#include <exception>
#include <memory>
#include <utility>

#include <google/protobuf/message.h>

#include <csikit/logging/log.hpp>
#include <csikit/utils/assert.hpp>

#include <protobuf/impl/redact.hpp>
#include <protobuf/impl/sensitive_fields.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace protobuf {

namespace {

const google::protobuf::Message* AsReflectable(const google::protobuf::MessageLite& message) {
    const auto* full = dynamic_cast<const google::protobuf::Message*>(&message);
    if (!full || !full->GetDescriptor()) return nullptr;
    return full;
}

SanitizeResult MakeNothingToSanitize(SanitizeError error) {
    SanitizeResult result;
    result.status = SanitizeStatus::kNoSensitiveFields;
    result.error = error;
    return result;
}

SanitizeResult MakeFailure(const google::protobuf::Message& message, SanitizeError error, std::string field) {
    LOG_WARNING() << "Failed to sanitize " << message.GetTypeName() << ": " << ToString(error)
                  << (field.empty() ? "" : " in field ") << field;
    SanitizeResult result;
    result.status = SanitizeStatus::kRedactionFailed;
    result.error = error;
    result.field = std::move(field);
    return result;
}

SanitizeResult DoSanitize(const google::protobuf::Message& message) {
    const auto fields = impl::FindSensitiveFields(*message.GetDescriptor());
    if (fields.empty()) {
        return MakeNothingToSanitize(SanitizeError::kNone);
    }

    const std::unique_ptr<google::protobuf::Message> copy{message.New()};
    copy->CopyFrom(message);

    if (auto failure = impl::Redact(*copy, fields)) {
        return MakeFailure(message, failure->error, std::move(failure->field));
    }

    SanitizeResult result;
    try {
        result.text = impl::Render(*copy);
    } catch (const utils::InvariantError&) {
        return MakeFailure(message, SanitizeError::kRenderFailed, {});
    }
    result.status = SanitizeStatus::kRedactionSucceeded;
    return result;
}

}  // namespace

std::string_view ToString(SanitizeStatus status) {
    switch (status) {
        case SanitizeStatus::kNoSensitiveFields:
            return "no sensitive fields";
        case SanitizeStatus::kRedactionFailed:
            return "redaction failed";
        case SanitizeStatus::kRedactionSucceeded:
            return "redaction succeeded";
    }
    return "unknown";
}

std::string_view ToString(SanitizeError error) {
    switch (error) {
        case SanitizeError::kNone:
            return "none";
        case SanitizeError::kNoSchemaMetadata:
            return "no schema metadata";
        case SanitizeError::kMalformedSensitiveField:
            return "sensitive field is not a map<string, string>";
        case SanitizeError::kUnwritableField:
            return "sensitive field can not be written";
        case SanitizeError::kRenderFailed:
            return "failed to render the redacted message";
        case SanitizeError::kInternalError:
            return "unexpected error while sanitizing";
    }
    return "unknown";
}

bool HasSensitiveFields(const google::protobuf::MessageLite& message) {
    const auto* reflectable = AsReflectable(message);
    return reflectable && !impl::FindSensitiveFields(*reflectable->GetDescriptor()).empty();
}

SanitizeResult Sanitize(const google::protobuf::MessageLite& message) {
    const auto* reflectable = AsReflectable(message);
    if (!reflectable) {
        return MakeNothingToSanitize(SanitizeError::kNoSchemaMetadata);
    }

    try {
        return DoSanitize(*reflectable);
    } catch (const std::exception& e) {
        LOG_ERROR() << "Failed to sanitize " << message.GetTypeName() << ": " << e.what();
    }

    SanitizeResult result;
    result.status = SanitizeStatus::kRedactionFailed;
    result.error = SanitizeError::kInternalError;
    return result;
}

std::string SanitizeMsg(const google::protobuf::MessageLite& message) {
    auto result = Sanitize(message);
    if (result.status != SanitizeStatus::kRedactionSucceeded) return {};
    return std::move(result.text);
}

}  // namespace protobuf

CSIKIT_NAMESPACE_END
