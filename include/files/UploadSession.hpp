#pragma once

#include <cstdint>
#include <string>
#include "core/Client.hpp"
#include "files/FileDescriptor.hpp"
#include "files/UploadOptions.hpp"

namespace geminiai {
namespace files {

/**
 * One resumable upload: initiate, transfer, finalize. Phases run strictly in
 * order and a session runs at most once. Any failure leaves the session in
 * Failed; there is no resuming from an offset, the whole file goes in a single
 * "upload, finalize" request.
 */
class UploadSession {
public:
    enum class Phase {
        Created,
        Initiating,
        Transferring,
        Finalizing,
        Done,
        Failed,
    };

    UploadSession(const Client& client, UploadRequest request);

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    // Throws ClientException on any failure
    FileDescriptor run();

    Phase phase() const { return phase_; }
    const std::string& uploadUrl() const { return uploadUrl_; }
    std::uint64_t contentLength() const { return contentLength_; }

    static const char* phaseName(Phase phase);

private:
    const Client& client_;
    const UploadRequest request_;
    Phase phase_ = Phase::Created;
    std::string uploadUrl_;         // single use, issued by the service
    std::uint64_t contentLength_ = 0;

    // Phase 1: POST the metadata, returns the upload URL header value
    std::string initiate();

    // Phase 2: POST the bytes to the upload URL with "upload, finalize"
    http::Response transfer(std::string content);

    // Phase 3: unwrap {"file": {...}} from the transfer response
    FileDescriptor finalize(const http::Response& response);
};

} // namespace files
} // namespace geminiai
