#pragma once

#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include <csikit/utils/string_map.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace protobuf::impl {

/// Checks that the field carries the `csi_secret` option, whatever its value
bool IsSensitive(const google::protobuf::FieldDescriptor& field);

bool IsMessage(const google::protobuf::FieldDescriptor& field);

/// Checks that the field is declared as `map<string, string>`; `bytes` values do not qualify
bool IsStringToStringMap(const google::protobuf::FieldDescriptor& field);

/// @brief Typed accessor of a single sensitive field, restricted to the `map<string, string>` shape.
class SensitiveField final {
public:
    explicit SensitiveField(const google::protobuf::FieldDescriptor& field) noexcept : field_(&field) {}

    const std::string& Name() const noexcept { return field_->full_name(); }

    const google::protobuf::FieldDescriptor& GetDescriptor() const noexcept { return *field_; }

    /// Returns std::nullopt if the field is not a `map<string, string>` of @a message
    std::optional<utils::StringMap> Read(const google::protobuf::Message& message) const;

    /// Replaces the field contents with @a values, returns false if @a message can not be modified
    bool Write(google::protobuf::Message& message, const utils::StringMap& values) const;

    /// Checks that the field is declared in the type of @a message
    bool BelongsTo(const google::protobuf::Message& message) const;

private:

    const google::protobuf::FieldDescriptor* field_;
};

/// Returns the sensitive fields declared directly in @a descriptor, in declaration order
std::vector<SensitiveField> FindSensitiveFields(const google::protobuf::Descriptor& descriptor);

/// @brief Returns true if @a descriptor or any message type reachable from its fields declares a sensitive field.
///
/// Recursive message types are visited once.
bool ContainsSensitiveFields(const google::protobuf::Descriptor& descriptor);

}  // namespace protobuf::impl

CSIKIT_NAMESPACE_END
