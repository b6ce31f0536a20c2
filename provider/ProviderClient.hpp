#pragma once

#include "RateLimiter.hpp"
#include "TokenManager.hpp"
#include "../core/IClock.hpp"
#include "../core/ports/IPolicyEngine.hpp"
#include "../core/ports/IProviderStateStore.hpp"
#include "../core/ports/IProviderTransport.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace tripseg::provider {

// Soft-failure codes embedded in the provider's JSON "status" field
struct ProviderStatusCodes {
    int success = 0;
    int rateLimited = 8902;
    std::vector<int> tokenExpired{9903, 9906};
    int badParameters = 9904;
};

struct ProviderClientConfig {
    std::string baseUrl = "https://api.gps51.com/openapi";
    std::string username;
    std::string password;
    std::string browser = "Chrome/120.0.0.0";
    std::chrono::milliseconds requestTimeout{30000};
    TokenPolicy tokenPolicy;
    ProviderStatusCodes statusCodes;
};

struct ProviderResponse {
    int status = 0;
    std::string cause;
    nlohmann::json body;
};

/**
 * @brief The single outbound channel to the telemetry provider
 *
 * Every HTTP exchange, login included, passes the shared RateLimiter. Each
 * soft-failure code gets its own recovery: rate limiting sets the shared
 * back-off and retries with growing spacing, an expired token is renewed once,
 * bad parameters fail immediately.
 */
class ProviderClient {
public:
    ProviderClient(std::shared_ptr<ports::IProviderTransport> transport,
                   std::shared_ptr<IClock> clock,
                   std::shared_ptr<RateLimiter> rateLimiter,
                   std::shared_ptr<ports::IPolicyEngine> policyEngine,
                   ProviderClientConfig config,
                   std::shared_ptr<ports::IProviderStateStore> stateStore = nullptr);
    
    ProviderClient(const ProviderClient&) = delete;
    ProviderClient& operator=(const ProviderClient&) = delete;

    ports::ProviderSession acquireToken();
    
    ProviderResponse call(const std::string& action, const nlohmann::json& params, Timestamp deadline);

    const TokenManager& tokenManager() const { return *tokenManager_; }
    const ProviderClientConfig& config() const { return config_; }

private:
    ports::ProviderSession performLogin();
    nlohmann::json exchange(const std::string& url, const nlohmann::json& body, Timestamp deadline);
    std::string buildUrl(const std::string& action, const ports::ProviderSession* session) const;
    bool isTokenExpired(int status) const;
    static int statusOf(const nlohmann::json& body);
    static std::string causeOf(const nlohmann::json& body);

    std::shared_ptr<ports::IProviderTransport> transport_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<RateLimiter> rateLimiter_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    ProviderClientConfig config_;
    std::unique_ptr<TokenManager> tokenManager_;
};

} // namespace tripseg::provider
