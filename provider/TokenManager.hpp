#pragma once

#include "../core/IClock.hpp"
#include "../core/ports/IProviderStateStore.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace tripseg::provider {

struct TokenPolicy {
    std::chrono::seconds tokenValidity{24 * 3600};
    // Tokens closer than this to expiry are renewed before use
    std::chrono::seconds refreshBuffer{3600};
};

/**
 * @brief Caches the provider session and renews it single-flight
 *
 * Concurrent callers that find no fresh token share one login: the first
 * caller performs it, the others wait on the same shared future and receive
 * the same session or the same exception.
 */
class TokenManager {
public:
    // Performs the login exchange; expiresAt of the returned session is filled in here.
    using LoginFunction = std::function<ports::ProviderSession()>;

    TokenManager(std::shared_ptr<IClock> clock,
                 LoginFunction login,
                 TokenPolicy policy = {},
                 std::shared_ptr<ports::IProviderStateStore> stateStore = nullptr);

    ports::ProviderSession acquireToken();
    
    /// Drops the cached session if it still holds token.
    void invalidate(const std::string& token);
    
    std::optional<ports::ProviderSession> cachedSession() const;
    int loginCount() const;

private:
    bool isFresh(const ports::ProviderSession& session, Timestamp now) const;

    std::shared_ptr<IClock> clock_;
    LoginFunction login_;
    TokenPolicy policy_;
    std::shared_ptr<ports::IProviderStateStore> stateStore_;
    
    mutable std::mutex mutex_;
    std::optional<ports::ProviderSession> session_;
    std::shared_future<ports::ProviderSession> inFlight_;
    bool loadedFromStore_ = false;
    int loginCount_ = 0;
};

} // namespace tripseg::provider
