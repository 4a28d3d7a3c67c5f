#pragma once

/// @file csikit/volume/credentials.hpp
/// @brief Resolution of credentials referenced by name from a volume spec

#include <memory>
#include <string>

#include <csikit/config/config.hpp>
#include <csikit/utils/string_map.hpp>
#include <csikit/volume/exceptions.hpp>
#include <csikit/volume/v1/volume.pb.h>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

/// @brief Interface of a credential source.
///
/// Implementations must be safe to call concurrently.
class CredentialResolver {
public:
    virtual ~CredentialResolver() = default;

    /// @brief Returns key/value pairs of the referenced secret.
    /// @throws SecretNotFoundError if there is no such secret
    /// @throws SecretAccessDeniedError if the secret exists but can not be read
    virtual utils::StringMap Resolve(const v1::SecretReference& reference) const = 0;
};

/// @brief Reads secrets laid out the way a mounted secret volume is: `<root>/<namespace>/<name>/<key>`.
///
/// Every regular file of the secret directory is one key, the file contents is the value. Entries starting with
/// a dot (`..data` and friends) are skipped.
class DirectoryCredentialResolver final : public CredentialResolver {
public:
    explicit DirectoryCredentialResolver(std::string root);

    utils::StringMap Resolve(const v1::SecretReference& reference) const override;

    const std::string& GetRoot() const noexcept { return root_; }

private:
    const std::string root_;
};

std::unique_ptr<CredentialResolver> MakeCredentialResolver(const config::Config& config);

/// Operation the credentials are requested for
enum class SecretStage {
    kControllerPublish,
    kControllerExpand,
    kNodeStage,
    kNodePublish,
};

/// @brief Resolves the secret the CSI source references for @a stage.
///
/// A source without a reference for @a stage needs no credentials, an empty map is returned then.
utils::StringMap ResolveStageCredentials(
    const CredentialResolver& resolver,
    const v1::CsiPersistentVolumeSource& source,
    SecretStage stage
);

}  // namespace volume

CSIKIT_NAMESPACE_END
