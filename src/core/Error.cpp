#include "core/Error.hpp"

namespace geminiai {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::LocalIOError: return "LocalIOError";
        case ErrorKind::ProtocolViolation: return "ProtocolViolation";
        case ErrorKind::RemoteError: return "RemoteError";
        case ErrorKind::TransportError: return "TransportError";
        case ErrorKind::MalformedResponse: return "MalformedResponse";
        case ErrorKind::InternalError: return "InternalError";
    }
    return "Unknown";
}

Error Error::remote(int status, const std::string& body) {
    return Error{ErrorKind::RemoteError, "HTTP " + std::to_string(status) + ": " + body, status, body};
}

std::string Error::describe() const {
    return std::string(to_string(kind)) + ": " + message;
}

} // namespace geminiai
