#include <csikit/volume/exceptions.hpp>

#include <fmt/format.h>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

CredentialError::CredentialError(
    std::string_view what,
    std::string_view secret_namespace,
    std::string_view secret_name
)
    : std::runtime_error(fmt::format("{} namespace: '{}', name: '{}'", what, secret_namespace, secret_name)) {}

SecretNotFoundError::SecretNotFoundError(std::string_view secret_namespace, std::string_view secret_name)
    : CredentialError(kWhat, secret_namespace, secret_name) {}

SecretAccessDeniedError::SecretAccessDeniedError(std::string_view secret_namespace, std::string_view secret_name)
    : CredentialError(kWhat, secret_namespace, secret_name) {}

MetadataError::MetadataError(std::string_view what, std::string_view path, std::string_view details)
    : std::runtime_error(
          details.empty() ? fmt::format("{} path: '{}'", what, path)
                          : fmt::format("{} path: '{}': {}", what, path, details)
      ) {}

MetadataNotFoundError::MetadataNotFoundError(std::string_view path) : MetadataError(kWhat, path, {}) {}

MalformedMetadataError::MalformedMetadataError(std::string_view path, std::string_view details)
    : MetadataError(kWhat, path, details) {}

MetadataIoError::MetadataIoError(std::string_view path, std::string_view details)
    : MetadataError(kWhat, path, details) {}

}  // namespace volume

CSIKIT_NAMESPACE_END
