#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace geminiai {

enum class ErrorKind {
    InvalidArgument,    // rejected options or arguments, nothing was sent
    LocalIOError,       // local file stat/read failed
    ProtocolViolation,  // response shape breaks the upload handshake
    RemoteError,        // non-200 status; status and body are kept
    TransportError,     // exchange could not complete
    MalformedResponse,  // payload could not be normalized
    InternalError,      // session terminated abnormally
};

const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::InternalError;
    std::string message;
    int status = 0;      // RemoteError only
    std::string body;    // RemoteError only

    static Error remote(int status, const std::string& body);

    // "<Kind>: <message>"
    std::string describe() const;
};

/**
 * Carries an Error through the layers below the public entry points,
 * which catch it and return a Result.
 */
class ClientException : public std::runtime_error {
public:
    explicit ClientException(Error error)
        : std::runtime_error(error.describe()), error_(std::move(error)) {}

    ClientException(ErrorKind kind, const std::string& message)
        : ClientException(Error{kind, message, 0, ""}) {}

    const Error& error() const { return error_; }

private:
    Error error_;
};

} // namespace geminiai
