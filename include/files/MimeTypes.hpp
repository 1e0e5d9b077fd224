#pragma once

#include <string>

namespace geminiai {
namespace files {

class MimeTypes {
public:
    // MIME type from the path's extension (case-insensitive);
    // application/octet-stream when unknown or missing
    static std::string fromPath(const std::string& path);

    static constexpr const char* kDefault = "application/octet-stream";

private:
    // Lowercase extension without the dot, empty if none
    static std::string getExtension(const std::string& path);
};

} // namespace files
} // namespace geminiai
