#pragma once

#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/message.h>

#include <csikit/protobuf/sanitize.hpp>

#include <protobuf/impl/sensitive_fields.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace protobuf::impl {

struct RedactFailure {
    SanitizeError error;
    std::string field;
};

/// @brief Replaces every value of every field in @a fields with kRedactionMarker, keeping the keys.
///
/// Stops on the first field that can not be redacted; the message is left partially redacted in that case
/// and must not be rendered. A field not declared in the type of @a message fails with
/// SanitizeError::kUnwritableField.
std::optional<RedactFailure> Redact(google::protobuf::Message& message, const std::vector<SensitiveField>& fields);

/// @brief Redacts the sensitive fields of @a message and of every message nested in it, map values included.
///
/// Same failure rules as Redact.
std::optional<RedactFailure> RedactRecursive(google::protobuf::Message& message);

/// @brief Single-line text format of @a message, map entries ordered by key.
/// @throws utils::InvariantError if the message can not be printed
std::string Render(const google::protobuf::Message& message);

}  // namespace protobuf::impl

CSIKIT_NAMESPACE_END
