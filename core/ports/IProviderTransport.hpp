#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace tripseg::ports {

struct HttpResponse {
    int statusCode = 0;
    std::string body;
};

// Raised when no HTTP response could be obtained (DNS, connect, TLS, read timeout).
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

class IProviderTransport {
public:
    virtual ~IProviderTransport() = default;
    
    virtual HttpResponse post(const std::string& url,
                              const std::string& jsonBody,
                              std::chrono::milliseconds timeout) = 0;
};

} // namespace tripseg::ports
