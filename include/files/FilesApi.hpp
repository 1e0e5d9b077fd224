#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/Client.hpp"
#include "core/Result.hpp"
#include "files/FileDescriptor.hpp"
#include "files/UploadOptions.hpp"

namespace geminiai {
namespace files {

struct ListOptions {
    std::optional<int> pageSize;          // must be positive when set
    std::optional<std::string> pageToken; // from a previous FileList::nextPageToken
};

// Uploads one file with the resumable protocol
Result<FileDescriptor> uploadFile(const Client& client, const std::string& path,
                                  const UploadOptions& options = {});

// Uploads all files concurrently; descriptors come back in input order,
// or the first error alone (see BatchUploader)
Result<std::vector<FileDescriptor>> uploadFiles(const Client& client,
                                                const std::vector<std::string>& paths,
                                                const UploadOptions& options = {});

Result<FileList> listFiles(const Client& client, const ListOptions& options = {});

// "abc" and "files/abc" name the same file
Result<FileDescriptor> getFile(const Client& client, const std::string& name);

Result<void> deleteFile(const Client& client, const std::string& name);

} // namespace files
} // namespace geminiai
