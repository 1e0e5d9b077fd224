#include "files/UploadSession.hpp"
#include "core/Error.hpp"
#include <iostream>
#include <utility>

namespace geminiai {
namespace files {

namespace {
    const char* kUploadUrlHeader = "X-Goog-Upload-URL";

    [[noreturn]] void failRemote(const char* phase, const http::Response& response) {
        std::cerr << (std::string("HTTP error ") + std::to_string(response.status) +
                      " during upload " + phase + ": " + response.body + "\n") << std::flush;
        throw ClientException(Error::remote(response.status, response.body));
    }
}

UploadSession::UploadSession(const Client& client, UploadRequest request)
    : client_(client), request_(std::move(request)) {}

const char* UploadSession::phaseName(Phase phase) {
    switch (phase) {
        case Phase::Created: return "created";
        case Phase::Initiating: return "initiating";
        case Phase::Transferring: return "transferring";
        case Phase::Finalizing: return "finalizing";
        case Phase::Done: return "done";
        case Phase::Failed: return "failed";
    }
    return "unknown";
}

FileDescriptor UploadSession::run() {
    if (phase_ != Phase::Created) {
        throw ClientException(ErrorKind::InternalError,
                              std::string("Upload session already ") + phaseName(phase_));
    }

    try {
        // Stat before touching the network so a missing file costs no request
        contentLength_ = client_.storage().size(request_.path);

        phase_ = Phase::Initiating;
        uploadUrl_ = initiate();

        phase_ = Phase::Transferring;
        std::string content = client_.storage().readAll(request_.path);
        if (content.size() != contentLength_) {
            throw ClientException(ErrorKind::LocalIOError,
                                  "File changed size during upload: " + request_.path);
        }
        http::Response response = transfer(std::move(content));

        phase_ = Phase::Finalizing;
        FileDescriptor file = finalize(response);

        phase_ = Phase::Done;
        client_.debug("Uploaded " + request_.path + " as " + file.name);
        return file;
    } catch (const ClientException& e) {
        client_.debug("Upload of " + request_.path + " failed while " + phaseName(phase_) + ": " + e.what());
        phase_ = Phase::Failed;
        throw;
    } catch (const std::exception&) {
        phase_ = Phase::Failed;
        throw;
    }
}

std::string UploadSession::initiate() {
    http::Request request;
    request.method = HttpRequest::POST;
    request.url = client_.uploadUrl("v1beta/files");
    client_.authorize(request);
    request.addHeader("X-Goog-Upload-Protocol", "resumable")
           .addHeader("X-Goog-Upload-Command", "start")
           .addHeader("X-Goog-Upload-Header-Content-Length", std::to_string(contentLength_))
           .addHeader("X-Goog-Upload-Header-Content-Type", request_.mimeType);
    request.setJson({{"file", {{"display_name", request_.displayName}}}});

    client_.debug("Starting resumable upload of " + request_.path + " (" +
                  std::to_string(contentLength_) + " bytes, " + request_.mimeType + ")");

    http::Response response = client_.send(request);
    if (!response.ok()) {
        failRemote("start", response);
    }

    // The session URL only ever arrives in this header; anything but one value is unusable
    std::vector<std::string> urls = response.header(kUploadUrlHeader);
    if (urls.size() != 1) {
        throw ClientException(ErrorKind::ProtocolViolation,
                              "Expected exactly one " + std::string(kUploadUrlHeader) +
                              " header, got " + std::to_string(urls.size()));
    }
    if (urls.front().empty()) {
        throw ClientException(ErrorKind::ProtocolViolation,
                              std::string(kUploadUrlHeader) + " header is empty");
    }
    return urls.front();
}

http::Response UploadSession::transfer(std::string content) {
    // The upload URL is fully qualified and carries its own authorization,
    // so neither the base URL nor the key query parameter of phase 1 apply here
    http::Request request;
    request.method = HttpRequest::POST;
    request.url = uploadUrl_;
    if (client_.config().forwardApiKeyOnTransfer) {
        client_.authorize(request);
    }
    request.addHeader("Content-Length", std::to_string(content.size()))
           .addHeader("X-Goog-Upload-Offset", "0")
           .addHeader("X-Goog-Upload-Command", "upload, finalize");
    request.body = std::move(content);

    return client_.send(request);
}

FileDescriptor UploadSession::finalize(const http::Response& response) {
    if (response.status != 200) {
        failRemote("finalize", response);
    }

    nlohmann::json body;
    try {
        body = response.json();
    } catch (const nlohmann::json::parse_error& e) {
        throw ClientException(ErrorKind::MalformedResponse,
                              std::string("Upload response is not JSON: ") + e.what());
    }

    if (!body.is_object() || !body.contains("file")) {
        throw ClientException(ErrorKind::MalformedResponse,
                              "Upload response has no 'file' object: " + body.dump());
    }
    return FileDescriptor::fromJson(body["file"]);
}

} // namespace files
} // namespace geminiai
