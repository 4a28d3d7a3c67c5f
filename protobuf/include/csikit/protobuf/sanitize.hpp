#pragma once

/// @file csikit/protobuf/sanitize.hpp
/// @brief Redaction of `csi_secret` fields in protobuf messages before logging
///
/// A field is sensitive if its schema carries the `(csikit.csi.v1.csi_secret)` option, whatever its value. Such a
/// field must be a `map<string, string>`: every value of the map is replaced with @ref kRedactionMarker, keys are
/// kept. Only the fields declared directly in the message type are inspected.
///
/// Example:
/// @code
/// csikit::csi::v1::NodeStageVolumeRequest request;
/// request.set_volume_id("vol-123");
/// (*request.mutable_secrets())["password"] = "p@ss";
///
/// // volume_id: "vol-123" secrets { key: "password" value: "* * * Sanitized * * *" }
/// LOG_DEBUG() << protobuf::SanitizeMsg(request);
/// @endcode

#include <string>
#include <string_view>

#include <google/protobuf/message_lite.h>

CSIKIT_NAMESPACE_BEGIN

namespace protobuf {

/// Substituted for every value of a sensitive map
inline constexpr std::string_view kRedactionMarker = "* * * Sanitized * * *";

enum class SanitizeStatus {
    /// The message schema declares no sensitive fields, there is nothing to redact
    kNoSensitiveFields,
    /// Sensitive fields exist but could not be redacted safely, nothing may be logged
    kRedactionFailed,
    kRedactionSucceeded,
};

enum class SanitizeError {
    kNone,
    /// The message is built against the lite runtime and has no descriptors
    kNoSchemaMetadata,
    /// A sensitive field is not a `map<string, string>`
    kMalformedSensitiveField,
    /// The redacted value could not be stored into the message copy
    kUnwritableField,
    kRenderFailed,
    /// Unexpected exception while copying or redacting the message
    kInternalError,
};

std::string_view ToString(SanitizeStatus status);

std::string_view ToString(SanitizeError error);

struct SanitizeResult {
    SanitizeStatus status{SanitizeStatus::kNoSensitiveFields};
    SanitizeError error{SanitizeError::kNone};
    /// Full name of the field that failed redaction, empty otherwise
    std::string field;
    /// Rendered redacted message, empty unless status is kRedactionSucceeded
    std::string text;
};

/// @brief Returns true if the message schema declares at least one sensitive field.
///
/// Only the schema is inspected, field contents do not matter.
bool HasSensitiveFields(const google::protobuf::MessageLite& message);

/// @brief Redacts a copy of @a message and reports the outcome. @a message itself is never modified.
///
/// Redaction failures are reported via SanitizeResult::status and SanitizeResult::error, not by exceptions.
SanitizeResult Sanitize(const google::protobuf::MessageLite& message);

/// @brief Returns a single-line text representation of @a message with secrets redacted.
///
/// An empty string means that there is no sanitized form to log: either the message has no sensitive fields,
/// or they could not be redacted. An empty result must never be read as "no secrets present".
std::string SanitizeMsg(const google::protobuf::MessageLite& message);

}  // namespace protobuf

CSIKIT_NAMESPACE_END
