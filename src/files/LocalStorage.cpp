#include "files/LocalStorage.hpp"
#include "core/Error.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace geminiai {
namespace files {

std::uint64_t DiskStorage::size(const std::string& path) const {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw ClientException(ErrorKind::LocalIOError, "File not found: " + path);
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw ClientException(ErrorKind::LocalIOError, "Not a regular file: " + path);
    }

    auto bytes = std::filesystem::file_size(path, ec);
    if (ec) {
        throw ClientException(ErrorKind::LocalIOError,
                              "Cannot stat file: " + path + " (" + ec.message() + ")");
    }
    return static_cast<std::uint64_t>(bytes);
}

std::string DiskStorage::readAll(const std::string& path) const {
    std::ifstream inFile(path, std::ios::binary);
    if (!inFile) {
        throw ClientException(ErrorKind::LocalIOError,
                              "Cannot open file: " + path + " (" + strerror(errno) + ")");
    }

    std::string content((std::istreambuf_iterator<char>(inFile)),
                        std::istreambuf_iterator<char>());
    if (inFile.bad()) {
        throw ClientException(ErrorKind::LocalIOError, "Failed to read file: " + path);
    }
    return content;
}

} // namespace files
} // namespace geminiai
