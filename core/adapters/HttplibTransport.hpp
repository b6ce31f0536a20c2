#pragma once

#include "../ports/IProviderTransport.hpp"
#include <string>

namespace tripseg::adapters {

// HTTPS POST through cpp-httplib. One client per request; the provider rate keeps this cheap.
class HttplibTransport : public ports::IProviderTransport {
public:
    explicit HttplibTransport(bool verifyServerCert = true);
    ~HttplibTransport() override = default;

    ports::HttpResponse post(const std::string& url,
                             const std::string& jsonBody,
                             std::chrono::milliseconds timeout) override;

    static void splitUrl(const std::string& url, std::string& origin, std::string& pathAndQuery);

private:
    bool verifyServerCert_;
};

} // namespace tripseg::adapters
