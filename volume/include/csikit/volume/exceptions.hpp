#pragma once

/// @file csikit/volume/exceptions.hpp
/// @brief Exceptions thrown by credential resolution, volume metadata and volume spec helpers

#include <stdexcept>
#include <string_view>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

/// @brief Base exception thrown by CredentialResolver::Resolve
class CredentialError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

protected:
    CredentialError(std::string_view what, std::string_view secret_namespace, std::string_view secret_name);
};

class SecretNotFoundError final : public CredentialError {
    static constexpr const char* kWhat = "Secret not found.";

public:
    SecretNotFoundError(std::string_view secret_namespace, std::string_view secret_name);
};

class SecretAccessDeniedError final : public CredentialError {
    static constexpr const char* kWhat = "Access to the secret is denied.";

public:
    SecretAccessDeniedError(std::string_view secret_namespace, std::string_view secret_name);
};

/// @brief Base exception thrown by SaveVolumeData and LoadVolumeData
class MetadataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

protected:
    MetadataError(std::string_view what, std::string_view path, std::string_view details);
};

class MetadataNotFoundError final : public MetadataError {
    static constexpr const char* kWhat = "Volume data file not found.";

public:
    explicit MetadataNotFoundError(std::string_view path);
};

/// @brief Volume data file exists but is not a JSON object of strings
class MalformedMetadataError final : public MetadataError {
    static constexpr const char* kWhat = "Malformed volume data file.";

public:
    MalformedMetadataError(std::string_view path, std::string_view details);
};

class MetadataIoError final : public MetadataError {
    static constexpr const char* kWhat = "Failed to access volume data file.";

public:
    MetadataIoError(std::string_view path, std::string_view details);
};

/// @brief Volume spec does not describe a CSI persistent volume
class InvalidVolumeSpecError final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace volume

CSIKIT_NAMESPACE_END
