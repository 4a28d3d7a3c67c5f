#include <csikit/volume/metadata_store.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fmt/format.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <csikit/logging/log.hpp>
#include <csikit/volume/log.hpp>

CSIKIT_NAMESPACE_BEGIN

namespace volume {

namespace {

namespace fs = boost::filesystem;

std::string JoinPath(const std::string& dir, const std::string& file_name) {
    return (fs::path{dir} / file_name).string();
}

std::string ToJson(const utils::StringMap& data, const std::string& path) {
    google::protobuf::Struct object;
    auto& fields = *object.mutable_fields();
    for (const auto& [key, value] : data) {
        fields[key].set_string_value(value);
    }

    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(object, &json);
    if (!status.ok()) {
        throw MetadataIoError(path, status.ToString());
    }
    return json;
}

utils::StringMap FromJson(const std::string& json, const std::string& path) {
    google::protobuf::Struct object;
    const auto status = google::protobuf::util::JsonStringToMessage(json, &object);
    if (!status.ok()) {
        throw MalformedMetadataError(path, status.ToString());
    }

    utils::StringMap data;
    for (const auto& [key, value] : object.fields()) {
        if (value.kind_case() != google::protobuf::Value::kStringValue) {
            throw MalformedMetadataError(path, fmt::format("value of '{}' is not a string", key));
        }
        data.emplace(key, value.string_value());
    }
    return data;
}

}  // namespace

void SaveVolumeData(const std::string& dir, const std::string& file_name, const utils::StringMap& data) {
    const auto path = JoinPath(dir, file_name);
    LOG_DEBUG() << LogMsg("saving volume data file [{}]", path);

    try {
        const auto json = ToJson(data, path);

        std::ofstream output{path, std::ios::binary | std::ios::trunc};
        if (!output) {
            throw MetadataIoError(path, std::strerror(errno));
        }
        output << json << '\n';
        output.close();
        if (!output) {
            throw MetadataIoError(path, "write failed");
        }
    } catch (const MetadataError& e) {
        LOG_ERROR() << LogMsg("failed to save volume data file {}: {}", path, e.what());
        throw;
    }

    LOG_DEBUG() << LogMsg("volume data file saved successfully [{}]", path);
}

utils::StringMap LoadVolumeData(const std::string& dir, const std::string& file_name) {
    const auto path = JoinPath(dir, file_name);
    LOG_DEBUG() << LogMsg("loading volume data file [{}]", path);

    try {
        boost::system::error_code ec;
        const auto status = fs::status(path, ec);
        if (status.type() == fs::file_not_found) {
            throw MetadataNotFoundError(path);
        }
        if (ec) {
            throw MetadataIoError(path, ec.message());
        }

        std::ifstream input{path, std::ios::binary};
        if (!input) {
            throw MetadataIoError(path, std::strerror(errno));
        }
        const std::string json{std::istreambuf_iterator<char>{input}, std::istreambuf_iterator<char>{}};
        if (input.bad()) {
            throw MetadataIoError(path, "read failed");
        }
        return FromJson(json, path);
    } catch (const MetadataError& e) {
        LOG_ERROR() << LogMsg("failed to load volume data file [{}]: {}", path, e.what());
        throw;
    }
}

}  // namespace volume

CSIKIT_NAMESPACE_END
