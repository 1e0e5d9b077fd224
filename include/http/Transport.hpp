#pragma once

#include <stdexcept>
#include <string>
#include "http/Request.hpp"

namespace geminiai {
namespace http {

/**
 * Raised when an exchange could not be completed at all (DNS, connect, timeout).
 * A response with a non-200 status is NOT a TransportError.
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Issues one HTTP exchange. Implementations must be safe to call from several
 * threads at once; retry policy, if any, lives in the implementation.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Response send(const Request& request) = 0;
};

} // namespace http
} // namespace geminiai
