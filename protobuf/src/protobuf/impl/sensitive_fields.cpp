#include <protobuf/impl/sensitive_fields.hpp>

#include <unordered_set>

#include <csikit/csi/v1/csi.pb.h>

CSIKIT_NAMESPACE_BEGIN

namespace protobuf::impl {

namespace {

using google::protobuf::FieldDescriptor;

bool IsStringField(const FieldDescriptor* field) { return field && field->type() == FieldDescriptor::TYPE_STRING; }

bool ContainsSensitiveFields(
    const google::protobuf::Descriptor& descriptor,
    std::unordered_set<const google::protobuf::Descriptor*>& visited
) {
    if (!visited.insert(&descriptor).second) return false;

    for (int i = 0; i < descriptor.field_count(); ++i) {
        const auto& field = *descriptor.field(i);
        if (IsSensitive(field)) return true;
        if (IsMessage(field) && ContainsSensitiveFields(*field.message_type(), visited)) return true;
    }
    return false;
}

}  // namespace

// The value of the option does not matter, `[(csi_secret) = false]` marks the field as well
bool IsSensitive(const FieldDescriptor& field) { return field.options().HasExtension(::csikit::csi::v1::csi_secret); }

bool IsMessage(const FieldDescriptor& field) {
    return field.type() == FieldDescriptor::TYPE_MESSAGE || field.type() == FieldDescriptor::TYPE_GROUP;
}

bool IsStringToStringMap(const FieldDescriptor& field) {
    if (!field.is_map()) return false;
    const auto* entry = field.message_type();
    return IsStringField(entry->map_key()) && IsStringField(entry->map_value());
}

std::optional<utils::StringMap> SensitiveField::Read(const google::protobuf::Message& message) const {
    if (!IsStringToStringMap(*field_) || !BelongsTo(message)) return std::nullopt;

    const auto* reflection = message.GetReflection();
    if (!reflection) return std::nullopt;

    const auto* key_field = field_->message_type()->map_key();
    const auto* value_field = field_->message_type()->map_value();

    utils::StringMap values;
    const int size = reflection->FieldSize(message, field_);
    for (int i = 0; i < size; ++i) {
        const auto& entry = reflection->GetRepeatedMessage(message, field_, i);
        const auto* entry_reflection = entry.GetReflection();
        values.insert_or_assign(
            entry_reflection->GetString(entry, key_field), entry_reflection->GetString(entry, value_field)
        );
    }
    return values;
}

bool SensitiveField::Write(google::protobuf::Message& message, const utils::StringMap& values) const {
    if (!IsStringToStringMap(*field_) || !BelongsTo(message)) return false;

    const auto* reflection = message.GetReflection();
    if (!reflection) return false;

    const auto* key_field = field_->message_type()->map_key();
    const auto* value_field = field_->message_type()->map_value();

    reflection->ClearField(&message, field_);
    for (const auto& [key, value] : values) {
        auto* entry = reflection->AddMessage(&message, field_);
        if (!entry) return false;
        const auto* entry_reflection = entry->GetReflection();
        entry_reflection->SetString(entry, key_field, key);
        entry_reflection->SetString(entry, value_field, value);
    }
    return true;
}

bool SensitiveField::BelongsTo(const google::protobuf::Message& message) const {
    return message.GetDescriptor() == field_->containing_type();
}

std::vector<SensitiveField> FindSensitiveFields(const google::protobuf::Descriptor& descriptor) {
    std::vector<SensitiveField> result;
    for (int i = 0; i < descriptor.field_count(); ++i) {
        const auto* field = descriptor.field(i);
        if (IsSensitive(*field)) {
            result.emplace_back(*field);
        }
    }
    return result;
}

bool ContainsSensitiveFields(const google::protobuf::Descriptor& descriptor) {
    std::unordered_set<const google::protobuf::Descriptor*> visited;
    return ContainsSensitiveFields(descriptor, visited);
}

}  // namespace protobuf::impl

CSIKIT_NAMESPACE_END
