#include "core/Client.hpp"
#include "core/Error.hpp"
#include "http/CurlTransport.hpp"
#include <iostream>
#include <utility>

namespace geminiai {

namespace {
    std::string joinUrl(const std::string& base, const std::string& path) {
        if (path.empty()) return base;
        if (path.front() == '/') return base + path;
        return base + "/" + path;
    }
}

Client::Client(ClientConfig config)
    : config_(std::move(config)) {
    config_.normalize();
    config_.validate();
    transport_ = std::make_shared<http::CurlTransport>(config_.timeoutSeconds, config_.verbose);
    storage_ = std::make_shared<files::DiskStorage>();
}

Client::Client(ClientConfig config,
               std::shared_ptr<http::Transport> transport,
               std::shared_ptr<files::LocalStorage> storage)
    : config_(std::move(config)), transport_(std::move(transport)), storage_(std::move(storage)) {
    config_.normalize();
    config_.validate();
    if (!transport_ || !storage_) {
        throw ClientException(ErrorKind::InvalidArgument, "Client requires a transport and a storage");
    }
}

std::string Client::apiUrl(const std::string& path) const {
    return joinUrl(config_.baseUrl, path);
}

std::string Client::uploadUrl(const std::string& path) const {
    return joinUrl(config_.uploadBaseUrl, path);
}

void Client::authorize(http::Request& request) const {
    request.addQuery("key", config_.apiKey);
}

http::Response Client::send(const http::Request& request) const {
    try {
        return transport_->send(request);
    } catch (const http::TransportError& e) {
        throw ClientException(ErrorKind::TransportError, e.what());
    }
}

void Client::debug(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << ("DEBUG: " + message + "\n") << std::flush;
    }
}

} // namespace geminiai
