#pragma once

#include <memory>
#include <string>
#include "core/ClientConfig.hpp"
#include "http/Transport.hpp"
#include "files/LocalStorage.hpp"

namespace geminiai {

/**
 * Configuration plus the collaborators every call goes through.
 * Copies share the transport and storage, so a copy can outlive the original
 * (batch workers hold their own copy).
 */
class Client {
public:
    // Validates the config and wires libcurl and the local disk
    explicit Client(ClientConfig config);

    Client(ClientConfig config,
           std::shared_ptr<http::Transport> transport,
           std::shared_ptr<files::LocalStorage> storage = std::make_shared<files::DiskStorage>());

    const ClientConfig& config() const { return config_; }
    http::Transport& transport() const { return *transport_; }
    files::LocalStorage& storage() const { return *storage_; }

    // <baseUrl>/<path>
    std::string apiUrl(const std::string& path) const;

    // <uploadBaseUrl>/<path>
    std::string uploadUrl(const std::string& path) const;

    // Adds the API key as the "key" query parameter
    void authorize(http::Request& request) const;

    // Sends and maps TransportError to ClientException(TransportError)
    http::Response send(const http::Request& request) const;

    // Writes a DEBUG line to stderr when config().verbose is set
    void debug(const std::string& message) const;

private:
    ClientConfig config_;
    std::shared_ptr<http::Transport> transport_;
    std::shared_ptr<files::LocalStorage> storage_;
};

} // namespace geminiai
