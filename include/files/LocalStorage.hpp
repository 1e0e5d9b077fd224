#pragma once

#include <cstdint>
#include <string>

namespace geminiai {
namespace files {

/**
 * Local read side of an upload. Both calls throw
 * ClientException(LocalIOError) when the path is missing or unreadable.
 */
class LocalStorage {
public:
    virtual ~LocalStorage() = default;

    virtual std::uint64_t size(const std::string& path) const = 0;

    // Whole content in memory; no streaming
    virtual std::string readAll(const std::string& path) const = 0;
};

class DiskStorage : public LocalStorage {
public:
    std::uint64_t size(const std::string& path) const override;
    std::string readAll(const std::string& path) const override;
};

} // namespace files
} // namespace geminiai
