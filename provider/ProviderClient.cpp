#include "ProviderClient.hpp"
#include "ProviderErrors.hpp"
#include "../crypto/PasswordDigest.hpp"
#include <algorithm>
#include <iostream>

namespace tripseg::provider {

ProviderClient::ProviderClient(std::shared_ptr<ports::IProviderTransport> transport,
                               std::shared_ptr<IClock> clock,
                               std::shared_ptr<RateLimiter> rateLimiter,
                               std::shared_ptr<ports::IPolicyEngine> policyEngine,
                               ProviderClientConfig config,
                               std::shared_ptr<ports::IProviderStateStore> stateStore)
    : transport_(transport), clock_(clock), rateLimiter_(rateLimiter),
      policyEngine_(policyEngine), config_(std::move(config)) {
    tokenManager_ = std::make_unique<TokenManager>(
        clock_, [this]() { return performLogin(); }, config_.tokenPolicy, stateStore);
}

ports::ProviderSession ProviderClient::acquireToken() {
    return tokenManager_->acquireToken();
}

ProviderResponse ProviderClient::call(const std::string& action, const nlohmann::json& params, Timestamp deadline) {
    const auto& retryPolicy = policyEngine_->getRateLimitRetryPolicy();
    int rateLimitedAttempts = 0;
    bool tokenRenewed = false;
    
    while (true) {
        ports::ProviderSession session = tokenManager_->acquireToken();
        nlohmann::json body = exchange(buildUrl(action, &session), params, deadline);
        
        int status = statusOf(body);
        std::string cause = causeOf(body);
        
        if (status == config_.statusCodes.success) {
            return ProviderResponse{status, cause, std::move(body)};
        }
        
        if (status == config_.statusCodes.rateLimited) {
            rateLimiter_->applyBackoff();
            ++rateLimitedAttempts;
            if (!retryPolicy.shouldRetry(rateLimitedAttempts)) {
                throw ProviderRateLimited(status, rateLimitedAttempts);
            }
            
            auto delay = retryPolicy.getBackoffDelay(rateLimitedAttempts);
            if (clock_->now() + delay > deadline) {
                throw ProviderTimeout(action + " retry after rate limiting");
            }
            std::cerr << "[ProviderClient] " << action << " rate limited, retry " << rateLimitedAttempts
                      << " in " << delay.count() << " ms" << std::endl;
            clock_->sleepFor(delay);
            continue;
        }
        
        if (isTokenExpired(status)) {
            tokenManager_->invalidate(session.token);
            if (tokenRenewed) {
                throw ProviderTokenExpired(status);
            }
            std::cout << "[ProviderClient] Token expired during " << action << ", renewing" << std::endl;
            tokenRenewed = true;
            continue;
        }
        
        if (status == config_.statusCodes.badParameters) {
            throw ProviderBadParameters(status, cause);
        }
        
        throw ProviderGenericError(status, cause);
    }
}

ports::ProviderSession ProviderClient::performLogin() {
    nlohmann::json body = {
        {"type", "USER"},
        {"from", "web"},
        {"username", config_.username},
        {"password", PasswordDigest::md5Hex(config_.password)},
        {"browser", config_.browser}
    };
    
    Timestamp deadline = clock_->now() + config_.requestTimeout;
    nlohmann::json response;
    try {
        response = exchange(buildUrl("login", nullptr), body, deadline);
    } catch (const ProviderError& e) {
        throw AuthFailure(e.code(), e.what());
    }
    
    int status = statusOf(response);
    if (status == config_.statusCodes.rateLimited) {
        rateLimiter_->applyBackoff();
    }
    if (status != config_.statusCodes.success) {
        throw AuthFailure(status, causeOf(response));
    }
    
    ports::ProviderSession session;
    if (response.contains("token") && response["token"].is_string()) {
        session.token = response["token"].get<std::string>();
    }
    if (session.token.empty()) {
        throw AuthFailure(status, "login response carried no token");
    }
    
    if (response.contains("serverid") && !response["serverid"].is_null()) {
        const auto& serverId = response["serverid"];
        session.serverId = serverId.is_string() ? serverId.get<std::string>() : serverId.dump();
    }
    
    std::cout << "[ProviderClient] Logged in as " << config_.username << std::endl;
    return session;
}

nlohmann::json ProviderClient::exchange(const std::string& url, const nlohmann::json& body, Timestamp deadline) {
    const auto& retryPolicy = policyEngine_->getNetworkRetryPolicy();
    const std::string payload = body.dump();
    int attempts = 0;
    
    while (true) {
        rateLimiter_->acquire(deadline);
        
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_->now());
        if (remaining.count() <= 0) {
            throw ProviderTimeout("no time left for request");
        }
        
        std::string failure;
        try {
            ports::HttpResponse response = transport_->post(url, payload, std::min(remaining, config_.requestTimeout));
            if (response.statusCode == 200) {
                return nlohmann::json::parse(response.body);
            }
            failure = "HTTP " + std::to_string(response.statusCode);
        } catch (const ports::TransportError& e) {
            failure = e.what();
        } catch (const nlohmann::json::parse_error& e) {
            failure = std::string("malformed response: ") + e.what();
        }
        
        ++attempts;
        if (!retryPolicy.shouldRetry(attempts)) {
            throw ProviderTransportError(failure);
        }
        
        auto delay = retryPolicy.getBackoffDelay(attempts);
        if (clock_->now() + delay > deadline) {
            throw ProviderTimeout("retry after " + failure);
        }
        std::cerr << "[ProviderClient] Warning: request failed (" << failure << "), retry "
                  << attempts << " in " << delay.count() << " ms" << std::endl;
        clock_->sleepFor(delay);
    }
}

std::string ProviderClient::buildUrl(const std::string& action, const ports::ProviderSession* session) const {
    std::string url = config_.baseUrl + "?action=" + PasswordDigest::urlEncode(action);
    if (session) {
        url += "&token=" + PasswordDigest::urlEncode(session->token);
        if (!session->serverId.empty()) {
            url += "&serverid=" + PasswordDigest::urlEncode(session->serverId);
        }
    }
    return url;
}

bool ProviderClient::isTokenExpired(int status) const {
    const auto& codes = config_.statusCodes.tokenExpired;
    return std::find(codes.begin(), codes.end(), status) != codes.end();
}

int ProviderClient::statusOf(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("status")) {
        return -1;
    }
    const auto& status = body["status"];
    if (status.is_number()) {
        return status.get<int>();
    }
    if (status.is_string()) {
        try {
            return std::stoi(status.get<std::string>());
        } catch (const std::exception&) {
            return -1;
        }
    }
    return -1;
}

std::string ProviderClient::causeOf(const nlohmann::json& body) {
    if (body.is_object() && body.contains("cause") && body["cause"].is_string()) {
        return body["cause"].get<std::string>();
    }
    return "";
}

} // namespace tripseg::provider
