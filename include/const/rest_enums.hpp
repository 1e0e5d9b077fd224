#pragma once

namespace geminiai {

// Verbs the Files and generation endpoints are called with
enum class HttpRequest {
    GET,
    POST,
    DELETE,
};


inline const char* to_string(HttpRequest method) {
    switch(method) {
        case HttpRequest::GET: return "GET";
        case HttpRequest::POST: return "POST";
        case HttpRequest::DELETE: return "DELETE";
    }
    return "UNKNOWN";
}

} // namespace geminiai
