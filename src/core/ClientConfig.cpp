#include "core/ClientConfig.hpp"
#include "core/Error.hpp"
#include <fstream>

namespace geminiai {

namespace {
    std::string stripTrailingSlash(std::string url) {
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url;
    }

    void requireUrl(const std::string& url, const std::string& field) {
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            throw ClientException(ErrorKind::InvalidArgument,
                                  field + " must be an http(s) URL, got '" + url + "'");
        }
    }
}

void ClientConfig::normalize() {
    baseUrl = stripTrailingSlash(baseUrl);
    uploadBaseUrl = stripTrailingSlash(uploadBaseUrl);
}

void ClientConfig::validate() const {
    if (apiKey.empty()) {
        throw ClientException(ErrorKind::InvalidArgument, "api_key must be a non-empty string");
    }
    requireUrl(baseUrl, "base_url");
    requireUrl(uploadBaseUrl, "upload_base_url");
    if (timeoutSeconds <= 0) {
        throw ClientException(ErrorKind::InvalidArgument, "timeout_seconds must be positive");
    }
}

ClientConfig ClientConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ClientException(ErrorKind::InvalidArgument, "Configuration must be a JSON object");
    }

    ClientConfig config;
    try {
        config.apiKey = j.value("api_key", config.apiKey);
        config.baseUrl = j.value("base_url", config.baseUrl);
        config.uploadBaseUrl = j.value("upload_base_url", config.uploadBaseUrl);
        config.timeoutSeconds = j.value("timeout_seconds", config.timeoutSeconds);
        config.verbose = j.value("verbose", config.verbose);
        config.forwardApiKeyOnTransfer = j.value("forward_api_key_on_transfer", config.forwardApiKeyOnTransfer);
    } catch (const nlohmann::json::type_error& e) {
        throw ClientException(ErrorKind::InvalidArgument, std::string("Invalid configuration: ") + e.what());
    }

    config.normalize();
    config.validate();
    return config;
}

ClientConfig ClientConfig::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ClientException(ErrorKind::LocalIOError, "Cannot open configuration file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ClientException(ErrorKind::InvalidArgument,
                              "Invalid JSON in " + path + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace geminiai
