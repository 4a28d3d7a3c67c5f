#pragma once

/// @file csikit/volume/paths.hpp
/// @brief Directory layout the CSI plugin keeps per-volume data in

#include <string>
#include <string_view>

#include <csikit/config/config.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

/// Turns a qualified name into a single path component by replacing every '/' with '~'
std::string EscapeQualifiedNameForDisk(std::string_view name);

/// Plugin directories of the host the plugin runs on
class PluginDirs final {
public:
    PluginDirs(std::string plugins_dir, std::string plugin_name);

    explicit PluginDirs(const config::Config& config);

    /// `<plugins_dir>/<plugin_name>/volumeDevices`
    std::string GetVolumeDevicePluginDir() const;

private:
    std::string plugins_dir_;
    std::string plugin_name_;
};

/// @brief Path where the plugin keeps the symlink for a block device of @a spec_volume_id.
///
/// `<plugins_dir>/<plugin_name>/volumeDevices/<escaped spec_volume_id>/dev`
std::string GetVolumeDevicePluginDir(std::string_view spec_volume_id, const PluginDirs& dirs);

/// @brief Path where the plugin keeps the volume data for a block device of @a spec_volume_id.
///
/// `<plugins_dir>/<plugin_name>/volumeDevices/<escaped spec_volume_id>/data`
std::string GetVolumeDeviceDataDir(std::string_view spec_volume_id, const PluginDirs& dirs);

}  // namespace volume

CSIKIT_NAMESPACE_END
