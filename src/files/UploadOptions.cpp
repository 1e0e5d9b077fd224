#include "files/UploadOptions.hpp"
#include "files/MimeTypes.hpp"
#include "core/Error.hpp"
#include <filesystem>

namespace geminiai {
namespace files {

void UploadOptions::validate() const {
    if (mimeType && mimeType->empty()) {
        throw ClientException(ErrorKind::InvalidArgument, "mime_type must be a non-empty string");
    }
    if (displayName && displayName->empty()) {
        throw ClientException(ErrorKind::InvalidArgument, "display_name must be a non-empty string");
    }
}

UploadRequest UploadRequest::resolve(const std::string& path, const UploadOptions& options) {
    if (path.empty()) {
        throw ClientException(ErrorKind::InvalidArgument, "Upload path must not be empty");
    }
    options.validate();

    std::string mimeType = options.mimeType ? *options.mimeType : MimeTypes::fromPath(path);
    std::string displayName = options.displayName
        ? *options.displayName
        : std::filesystem::path(path).filename().string();

    if (displayName.empty()) {
        throw ClientException(ErrorKind::InvalidArgument, "Upload path has no file name: " + path);
    }

    return UploadRequest{path, mimeType, displayName};
}

} // namespace files
} // namespace geminiai
