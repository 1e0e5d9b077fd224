#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "const/rest_enums.hpp"

namespace geminiai {
namespace http {

// Ordered header list; the same name may appear more than once
using Headers = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive ASCII comparison, as HTTP header names require
bool iequals(const std::string& a, const std::string& b);

/**
 * Outgoing HTTP request handed to a Transport
 */
struct Request {
    HttpRequest method = HttpRequest::GET;
    std::string url;                                        // Fully qualified, without query string
    Headers headers;
    std::vector<std::pair<std::string, std::string>> query; // Appended as ?key=value (escaped by the transport)
    std::string body;                                       // Raw bytes; empty for GET/DELETE

    Request& addHeader(const std::string& name, const std::string& value) {
        headers.emplace_back(name, value);
        return *this;
    }

    Request& addQuery(const std::string& key, const std::string& value) {
        query.emplace_back(key, value);
        return *this;
    }

    // Serializes the payload and sets Content-Type: application/json
    Request& setJson(const nlohmann::json& payload);

    // All values of a header (case-insensitive name match)
    std::vector<std::string> header(const std::string& name) const;
};

/**
 * Response returned by a Transport for any completed exchange, whatever its status
 */
struct Response {
    int status = 0;
    Headers headers;
    std::string body;

    // All values of a header (case-insensitive name match), in arrival order
    std::vector<std::string> header(const std::string& name) const;

    bool ok() const { return status == 200; }

    // Parses the body; throws nlohmann::json::parse_error on invalid JSON
    nlohmann::json json() const { return nlohmann::json::parse(body); }
};

} // namespace http
} // namespace geminiai
