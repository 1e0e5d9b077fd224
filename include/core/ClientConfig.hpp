#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace geminiai {

/**
 * Explicit client configuration, constructed once and passed to every call.
 */
struct ClientConfig {
    std::string apiKey;
    std::string baseUrl = "https://generativelanguage.googleapis.com/v1beta";
    std::string uploadBaseUrl = "https://generativelanguage.googleapis.com/upload";
    long timeoutSeconds = 60;
    bool verbose = false;

    // Only for deployments whose upload URLs are not self-authenticating
    bool forwardApiKeyOnTransfer = false;

    // Drops trailing '/' from both base URLs
    void normalize();

    // Throws ClientException(InvalidArgument) on the first bad field
    void validate() const;

    // Missing keys keep their defaults; wrong types throw ClientException(InvalidArgument)
    static ClientConfig fromJson(const nlohmann::json& j);
    static ClientConfig fromFile(const std::string& path);
};

} // namespace geminiai
