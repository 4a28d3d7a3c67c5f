#include <protobuf/impl/redact.hpp>

#include <fmt/format.h>
#include <google/protobuf/text_format.h>

#include <csikit/utils/assert.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace protobuf::impl {

std::optional<RedactFailure> Redact(google::protobuf::Message& message, const std::vector<SensitiveField>& fields) {
    for (const auto& field : fields) {
        if (!field.BelongsTo(message)) {
            return RedactFailure{SanitizeError::kUnwritableField, field.Name()};
        }

        auto values = field.Read(message);
        if (!values) {
            return RedactFailure{SanitizeError::kMalformedSensitiveField, field.Name()};
        }

        for (auto& [key, value] : *values) {
            value = kRedactionMarker;
        }

        if (!field.Write(message, *values)) {
            return RedactFailure{SanitizeError::kUnwritableField, field.Name()};
        }
    }
    return std::nullopt;
}

std::optional<RedactFailure> RedactRecursive(google::protobuf::Message& message) {
    const auto& descriptor = *message.GetDescriptor();
    if (auto failure = Redact(message, FindSensitiveFields(descriptor))) {
        return failure;
    }

    const auto* reflection = message.GetReflection();
    for (int i = 0; i < descriptor.field_count(); ++i) {
        const auto& field = *descriptor.field(i);
        // sensitive fields are already redacted above
        if (!IsMessage(field) || IsSensitive(field) || !ContainsSensitiveFields(*field.message_type())) continue;

        if (field.is_repeated()) {
            // map entries are visited here as well, their values are the nested messages
            const int size = reflection->FieldSize(message, &field);
            for (int j = 0; j < size; ++j) {
                if (auto failure = RedactRecursive(*reflection->MutableRepeatedMessage(&message, &field, j))) {
                    return failure;
                }
            }
        } else if (reflection->HasField(message, &field)) {
            if (auto failure = RedactRecursive(*reflection->MutableMessage(&message, &field))) {
                return failure;
            }
        }
    }
    return std::nullopt;
}

std::string Render(const google::protobuf::Message& message) {
    google::protobuf::TextFormat::Printer printer;
    printer.SetSingleLineMode(true);
    printer.SetUseUtf8StringEscaping(true);

    std::string result;
    CSIKIT_INVARIANT(printer.PrintToString(message, &result), fmt::format("failed to print {}", message.GetTypeName()));

    // single line mode separates fields with a space and leaves one at the end
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

}  // namespace protobuf::impl

CSIKIT_NAMESPACE_END
