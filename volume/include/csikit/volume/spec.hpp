#pragma once

/// @file csikit/volume/spec.hpp
/// @brief Accessors of the CSI part of a volume spec

#include <google/protobuf/repeated_field.h>

#include <csikit/volume/exceptions.hpp>
#include <csikit/volume/v1/volume.pb.h>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

/// @throws InvalidVolumeSpecError if @a spec is not a persistent volume with a CSI source
const v1::CsiPersistentVolumeSource& GetCsiSourceFromSpec(const v1::VolumeSpec& spec);

/// @throws InvalidVolumeSpecError if @a spec is not a persistent volume with a CSI source
bool GetReadOnlyFromSpec(const v1::VolumeSpec& spec);

bool HasReadWriteOnce(const google::protobuf::RepeatedField<int>& access_modes);

}  // namespace volume

CSIKIT_NAMESPACE_END
