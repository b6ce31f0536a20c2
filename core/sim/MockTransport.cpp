#include "MockTransport.hpp"

namespace tripseg::sim {

ports::HttpResponse MockTransport::post(const std::string& url,
                                        const std::string& jsonBody,
                                        std::chrono::milliseconds /*timeout*/) {
    MockRequest request;
    request.url = url;
    request.action = actionOf(url);
    request.body = nlohmann::json::parse(jsonBody);
    
    Handler handler;
    Scripted scripted;
    bool haveScripted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        
        auto it = scripted_.find(request.action);
        if (it != scripted_.end() && !it->second.empty()) {
            scripted = it->second.front();
            it->second.pop_front();
            haveScripted = true;
        } else {
            handler = handler_;
        }
    }
    
    if (haveScripted) {
        if (!scripted.failure.empty()) {
            throw ports::TransportError(scripted.failure);
        }
        return scripted.response;
    }
    
    if (handler) {
        return handler(request);
    }
    throw ports::TransportError("no scripted response for action '" + request.action + "'");
}

void MockTransport::setHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void MockTransport::queueResponse(const std::string& action, const nlohmann::json& body, int statusCode) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_[action].push_back({jsonResponse(body, statusCode), ""});
}

void MockTransport::queueFailure(const std::string& action, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_[action].push_back({ports::HttpResponse{}, reason});
}

std::vector<MockRequest> MockTransport::getRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

size_t MockTransport::countFor(const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& request : requests_) {
        if (request.action == action) ++count;
    }
    return count;
}

ports::HttpResponse MockTransport::jsonResponse(const nlohmann::json& body, int statusCode) {
    return ports::HttpResponse{statusCode, body.dump()};
}

std::string MockTransport::actionOf(const std::string& url) {
    auto start = url.find("action=");
    if (start == std::string::npos) return "";
    start += 7;
    auto end = url.find('&', start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

} // namespace tripseg::sim
