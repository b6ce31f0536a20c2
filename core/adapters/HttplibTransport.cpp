#include "HttplibTransport.hpp"
#include "httplib.h"

namespace tripseg::adapters {

HttplibTransport::HttplibTransport(bool verifyServerCert)
    : verifyServerCert_(verifyServerCert) {
}

ports::HttpResponse HttplibTransport::post(const std::string& url,
                                           const std::string& jsonBody,
                                           std::chrono::milliseconds timeout) {
    std::string origin;
    std::string pathAndQuery;
    splitUrl(url, origin, pathAndQuery);
    
    httplib::Client client(origin);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.enable_server_certificate_verification(verifyServerCert_);
    
    auto result = client.Post(pathAndQuery, jsonBody, "application/json");
    if (!result) {
        throw ports::TransportError("POST " + origin + " failed: " + httplib::to_string(result.error()));
    }
    
    return ports::HttpResponse{result->status, result->body};
}

void HttplibTransport::splitUrl(const std::string& url, std::string& origin, std::string& pathAndQuery) {
    auto schemeEnd = url.find("://");
    auto pathStart = url.find('/', schemeEnd == std::string::npos ? 0 : schemeEnd + 3);
    
    if (pathStart == std::string::npos) {
        origin = url;
        pathAndQuery = "/";
    } else {
        origin = url.substr(0, pathStart);
        pathAndQuery = url.substr(pathStart);
    }
}

} // namespace tripseg::adapters
