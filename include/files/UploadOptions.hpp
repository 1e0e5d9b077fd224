#pragma once

#include <optional>
#include <string>

namespace geminiai {
namespace files {

struct UploadOptions {
    std::optional<std::string> mimeType;     // overrides detection from the extension
    std::optional<std::string> displayName;  // overrides the path's base name

    // Throws ClientException(InvalidArgument) if a set field is empty
    void validate() const;
};

/**
 * A path with every option resolved; what a session actually uploads.
 */
struct UploadRequest {
    const std::string path;
    const std::string mimeType;
    const std::string displayName;

    // Validates options and fills in the defaults; performs no I/O
    static UploadRequest resolve(const std::string& path, const UploadOptions& options);
};

} // namespace files
} // namespace geminiai
