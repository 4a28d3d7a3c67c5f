#pragma once

/// @file csikit/volume/metadata_store.hpp
/// @brief Persistence of per-volume key/value data as a JSON object

#include <string>

#include <csikit/utils/string_map.hpp>
#include <csikit/volume/exceptions.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

/// @brief Stores @a data as a JSON object of strings in `dir/file_name`, replacing the file if it exists.
/// @throws MetadataIoError if the file can not be written
void SaveVolumeData(const std::string& dir, const std::string& file_name, const utils::StringMap& data);

/// @brief Loads the data previously stored by SaveVolumeData.
/// @throws MetadataNotFoundError if there is no such file
/// @throws MalformedMetadataError if the file is not a JSON object with string values
/// @throws MetadataIoError if the file exists but can not be read
utils::StringMap LoadVolumeData(const std::string& dir, const std::string& file_name);

}  // namespace volume

CSIKIT_NAMESPACE_END
