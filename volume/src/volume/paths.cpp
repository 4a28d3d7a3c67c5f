#include <csikit/volume/paths.hpp>

#include <algorithm>
#include <utility>

#include <boost/filesystem/path.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

namespace {

constexpr std::string_view kVolumeDevicesDirName = "volumeDevices";

std::string GetVolumeDeviceSubdir(std::string_view spec_volume_id, const PluginDirs& dirs, std::string_view leaf) {
    const auto path = boost::filesystem::path{dirs.GetVolumeDevicePluginDir()} /
                      EscapeQualifiedNameForDisk(spec_volume_id) / std::string{leaf};
    return path.string();
}

}  // namespace

std::string EscapeQualifiedNameForDisk(std::string_view name) {
    std::string result{name};
    std::replace(result.begin(), result.end(), '/', '~');
    return result;
}

PluginDirs::PluginDirs(std::string plugins_dir, std::string plugin_name)
    : plugins_dir_(std::move(plugins_dir)), plugin_name_(std::move(plugin_name)) {}

PluginDirs::PluginDirs(const config::Config& config) : PluginDirs(config.plugins_dir, config.plugin_name) {}

std::string PluginDirs::GetVolumeDevicePluginDir() const {
    const auto path = boost::filesystem::path{plugins_dir_} / plugin_name_ / std::string{kVolumeDevicesDirName};
    return path.string();
}

std::string GetVolumeDevicePluginDir(std::string_view spec_volume_id, const PluginDirs& dirs) {
    return GetVolumeDeviceSubdir(spec_volume_id, dirs, "dev");
}

std::string GetVolumeDeviceDataDir(std::string_view spec_volume_id, const PluginDirs& dirs) {
    return GetVolumeDeviceSubdir(spec_volume_id, dirs, "data");
}

}  // namespace volume

CSIKIT_NAMESPACE_END
