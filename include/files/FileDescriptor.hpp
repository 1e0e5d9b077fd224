#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace geminiai {
namespace files {

/**
 * A file as confirmed by the Files service. Built from the service's
 * camelCase payload; never modified afterwards.
 */
struct FileDescriptor {
    std::string name;           // "files/<id>", stable service id
    std::string uri;            // locator used in generation requests
    std::string mimeType;
    std::string displayName;
    std::uint64_t sizeBytes = 0;
    std::string state;          // PROCESSING, ACTIVE, FAILED, ...
    std::string sha256Hash;
    std::string createTime;     // timestamps are kept as sent
    std::string updateTime;
    std::string expirationTime;

    // Throws ClientException(MalformedResponse) when name, uri or sizeBytes
    // is missing, or when a field has the wrong type
    static FileDescriptor fromJson(const nlohmann::json& j);

    // Back to the service's key names
    nlohmann::json to_json() const;

    // Parses a decimal string as sent in "sizeBytes"; nullopt if not a valid
    // non-negative 64-bit integer
    static std::optional<std::uint64_t> parseSize(const std::string& text);
};

/**
 * One page of a file listing.
 */
struct FileList {
    std::vector<FileDescriptor> files;
    std::string nextPageToken;  // empty on the last page
};

} // namespace files
} // namespace geminiai
