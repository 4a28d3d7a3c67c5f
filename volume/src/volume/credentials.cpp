#include <csikit/volume/credentials.hpp>

#include <fstream>
#include <iterator>
#include <string_view>
#include <utility>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fmt/format.h>

#include <csikit/logging/log.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

namespace {

namespace fs = boost::filesystem;

bool IsValidPathComponent(std::string_view name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
}

bool IsAccessDenied(const boost::system::error_code& ec) {
    return ec == boost::system::errc::permission_denied || ec == boost::system::errc::operation_not_permitted;
}

[[noreturn]] void ThrowResolveError(const v1::SecretReference& reference, const boost::system::error_code& ec) {
    LOG_ERROR() << "failed to find the secret " << reference.name() << " in the namespace " << reference.namespace_()
                << " with error: " << ec.message();
    if (IsAccessDenied(ec)) {
        throw SecretAccessDeniedError(reference.namespace_(), reference.name());
    }
    throw CredentialError(fmt::format(
        "Failed to read the secret namespace: '{}', name: '{}': {}",
        reference.namespace_(),
        reference.name(),
        ec.message()
    ));
}

const v1::SecretReference* FindStageReference(const v1::CsiPersistentVolumeSource& source, SecretStage stage) {
    switch (stage) {
        case SecretStage::kControllerPublish:
            return source.has_controller_publish_secret_ref() ? &source.controller_publish_secret_ref() : nullptr;
        case SecretStage::kControllerExpand:
            return source.has_controller_expand_secret_ref() ? &source.controller_expand_secret_ref() : nullptr;
        case SecretStage::kNodeStage:
            return source.has_node_stage_secret_ref() ? &source.node_stage_secret_ref() : nullptr;
        case SecretStage::kNodePublish:
            return source.has_node_publish_secret_ref() ? &source.node_publish_secret_ref() : nullptr;
    }
    return nullptr;
}

}  // namespace

DirectoryCredentialResolver::DirectoryCredentialResolver(std::string root) : root_(std::move(root)) {}

utils::StringMap DirectoryCredentialResolver::Resolve(const v1::SecretReference& reference) const {
    const auto& secret_namespace = reference.namespace_();
    const auto& secret_name = reference.name();
    if (!IsValidPathComponent(secret_namespace) || !IsValidPathComponent(secret_name)) {
        LOG_ERROR() << "invalid secret reference: namespace '" << secret_namespace << "', name '" << secret_name
                    << "'";
        throw SecretNotFoundError(secret_namespace, secret_name);
    }

    const auto secret_dir = fs::path{root_} / secret_namespace / secret_name;
    boost::system::error_code ec;
    const auto status = fs::status(secret_dir, ec);
    if (ec && status.type() != fs::file_not_found) ThrowResolveError(reference, ec);
    if (!fs::is_directory(status)) {
        LOG_ERROR() << "failed to find the secret " << secret_name << " in the namespace " << secret_namespace;
        throw SecretNotFoundError(secret_namespace, secret_name);
    }

    utils::StringMap credentials;
    fs::directory_iterator it{secret_dir, ec};
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        const auto key = it->path().filename().string();
        if (key.empty() || key.front() == '.') continue;

        const auto entry_status = it->status(ec);
        if (entry_status.type() == fs::file_not_found) {
            // dangling symlink
            ec.clear();
            continue;
        }
        if (ec) break;
        if (!fs::is_regular_file(entry_status)) continue;

        std::ifstream input{it->path().string(), std::ios::binary};
        if (!input) {
            ec = boost::system::errc::make_error_code(boost::system::errc::permission_denied);
            break;
        }
        credentials.insert_or_assign(
            key, std::string{std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{}}
        );
    }
    if (ec) ThrowResolveError(reference, ec);

    LOG_DEBUG() << "resolved " << credentials.size() << " credential keys of the secret " << secret_name
                << " in the namespace " << secret_namespace;
    return credentials;
}

std::unique_ptr<CredentialResolver> MakeCredentialResolver(const config::Config& config) {
    return std::make_unique<DirectoryCredentialResolver>(config.secrets_dir);
}

utils::StringMap ResolveStageCredentials(
    const CredentialResolver& resolver,
    const v1::CsiPersistentVolumeSource& source,
    SecretStage stage
) {
    const auto* reference = FindStageReference(source, stage);
    if (!reference) return {};
    return resolver.Resolve(*reference);
}

}  // namespace volume

CSIKIT_NAMESPACE_END
