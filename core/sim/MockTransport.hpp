#pragma once

#include "../ports/IProviderTransport.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tripseg::sim {

struct MockRequest {
    std::string url;
    std::string action;
    nlohmann::json body;
};

// Scripted stand-in for the provider. Responses are queued per action or produced by a handler.
class MockTransport : public ports::IProviderTransport {
public:
    using Handler = std::function<ports::HttpResponse(const MockRequest& request)>;

    MockTransport() = default;
    ~MockTransport() override = default;

    // IProviderTransport interface
    ports::HttpResponse post(const std::string& url,
                             const std::string& jsonBody,
                             std::chrono::milliseconds timeout) override;

    // Mock-specific methods for testing
    void setHandler(Handler handler);
    void queueResponse(const std::string& action, const nlohmann::json& body, int statusCode = 200);
    void queueFailure(const std::string& action, const std::string& reason);
    
    std::vector<MockRequest> getRequests() const;
    size_t countFor(const std::string& action) const;
    
    static ports::HttpResponse jsonResponse(const nlohmann::json& body, int statusCode = 200);
    static std::string actionOf(const std::string& url);

private:
    struct Scripted {
        ports::HttpResponse response;
        std::string failure;
    };

    mutable std::mutex mutex_;
    Handler handler_;
    std::map<std::string, std::deque<Scripted>> scripted_;
    std::vector<MockRequest> requests_;
};

} // namespace tripseg::sim
