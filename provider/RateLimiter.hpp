#pragma once

#include "../core/IClock.hpp"
#include "../core/ports/IProviderStateStore.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace tripseg::provider {

struct RateLimiterConfig {
    int maxCallsPerWindow = 3;
    std::chrono::milliseconds window{1000};
    std::chrono::milliseconds minSpacing{350};
    std::chrono::seconds backoffDuration{60};
};

/**
 * @brief Process-wide admission control for provider calls
 *
 * Admits at most maxCallsPerWindow calls per rolling window, keeps minSpacing
 * between consecutive calls and holds every caller while a shared back-off is
 * active. All bookkeeping happens under one mutex; waiting happens outside it.
 */
class RateLimiter {
public:
    RateLimiter(std::shared_ptr<IClock> clock,
                RateLimiterConfig config = {},
                std::shared_ptr<ports::IProviderStateStore> stateStore = nullptr);

    /// Blocks until a call may be made. Throws ProviderTimeout if that would pass deadline.
    void acquire(Timestamp deadline);
    
    /// Starts (or extends) the shared back-off after the provider reported rate limiting.
    void applyBackoff();
    
    std::optional<Timestamp> backoffUntil() const;
    size_t callsInWindow() const;

private:
    std::chrono::milliseconds admissionDelayLocked(Timestamp now);

    std::shared_ptr<IClock> clock_;
    RateLimiterConfig config_;
    std::shared_ptr<ports::IProviderStateStore> stateStore_;
    
    mutable std::mutex mutex_;
    std::deque<Timestamp> calls_;
    std::optional<Timestamp> lastCall_;
    std::optional<Timestamp> backoffUntil_;
};

} // namespace tripseg::provider
