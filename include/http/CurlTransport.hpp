#pragma once

#include <string>
#include "http/Transport.hpp"

namespace geminiai {
namespace http {

/**
 * Transport over libcurl. One easy handle per call, so concurrent sends
 * from different threads do not share connection state.
 */
class CurlTransport : public Transport {
public:
    explicit CurlTransport(long timeoutSeconds = 60, bool verbose = false);

    Response send(const Request& request) override;

private:
    long timeoutSeconds_;
    bool verbose_;
};

} // namespace http
} // namespace geminiai
