#include <csikit/volume/spec.hpp>

#include <algorithm>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

namespace {

constexpr const char* kNoCsiSource = "CSIPersistentVolumeSource not defined in spec";

bool HasCsiSource(const v1::VolumeSpec& spec) {
    return spec.has_persistent_volume() && spec.persistent_volume().has_spec() &&
           spec.persistent_volume().spec().has_csi();
}

}  // namespace

const v1::CsiPersistentVolumeSource& GetCsiSourceFromSpec(const v1::VolumeSpec& spec) {
    if (!HasCsiSource(spec)) throw InvalidVolumeSpecError(kNoCsiSource);
    return spec.persistent_volume().spec().csi();
}

bool GetReadOnlyFromSpec(const v1::VolumeSpec& spec) {
    if (!HasCsiSource(spec)) throw InvalidVolumeSpecError(kNoCsiSource);
    return spec.read_only();
}

bool HasReadWriteOnce(const google::protobuf::RepeatedField<int>& access_modes) {
    return std::any_of(access_modes.begin(), access_modes.end(), [](int mode) {
        return mode == v1::PersistentVolumeAccessMode::READ_WRITE_ONCE;
    });
}

}  // namespace volume

CSIKIT_NAMESPACE_END
