#include "files/MimeTypes.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace geminiai {
namespace files {

namespace {
    // Types the Files service accepts for generation input, plus common text formats
    const std::unordered_map<std::string, std::string>& extensionTable() {
        static const std::unordered_map<std::string, std::string> table = {
            {"pdf", "application/pdf"},
            {"json", "application/json"},
            {"xml", "application/xml"},
            {"zip", "application/zip"},
            {"js", "text/javascript"},
            {"py", "text/x-python"},
            {"txt", "text/plain"},
            {"text", "text/plain"},
            {"md", "text/markdown"},
            {"csv", "text/csv"},
            {"html", "text/html"},
            {"htm", "text/html"},
            {"css", "text/css"},
            {"rtf", "text/rtf"},
            {"png", "image/png"},
            {"jpg", "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"gif", "image/gif"},
            {"webp", "image/webp"},
            {"heic", "image/heic"},
            {"heif", "image/heif"},
            {"svg", "image/svg+xml"},
            {"wav", "audio/wav"},
            {"mp3", "audio/mpeg"},
            {"aiff", "audio/aiff"},
            {"aac", "audio/aac"},
            {"ogg", "audio/ogg"},
            {"oga", "audio/ogg"},
            {"flac", "audio/flac"},
            {"mp4", "video/mp4"},
            {"mpeg", "video/mpeg"},
            {"mpg", "video/mpeg"},
            {"mov", "video/quicktime"},
            {"avi", "video/x-msvideo"},
            {"flv", "video/x-flv"},
            {"webm", "video/webm"},
            {"wmv", "video/x-ms-wmv"},
            {"3gp", "video/3gpp"},
        };
        return table;
    }
}

std::string MimeTypes::getExtension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string MimeTypes::fromPath(const std::string& path) {
    std::string ext = getExtension(path);
    if (ext.empty()) {
        return kDefault;
    }

    const auto& table = extensionTable();
    auto it = table.find(ext);
    return it != table.end() ? it->second : kDefault;
}

} // namespace files
} // namespace geminiai
