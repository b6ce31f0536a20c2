#include "RateLimiter.hpp"
#include "ProviderErrors.hpp"
#include <algorithm>
#include <iostream>

namespace tripseg::provider {

RateLimiter::RateLimiter(std::shared_ptr<IClock> clock,
                         RateLimiterConfig config,
                         std::shared_ptr<ports::IProviderStateStore> stateStore)
    : clock_(clock), config_(config), stateStore_(stateStore) {
    if (stateStore_) {
        backoffUntil_ = stateStore_->loadBackoffUntil();
        if (backoffUntil_ && *backoffUntil_ > clock_->now()) {
            std::cout << "[RateLimiter] Resuming provider back-off until "
                      << formatIso8601(*backoffUntil_) << std::endl;
        }
    }
}

void RateLimiter::acquire(Timestamp deadline) {
    while (true) {
        std::chrono::milliseconds wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Timestamp now = clock_->now();
            wait = admissionDelayLocked(now);
            
            if (wait.count() <= 0) {
                calls_.push_back(now);
                lastCall_ = now;
                return;
            }
            
            if (now + wait > deadline) {
                throw ProviderTimeout("rate limiter admission needs " + std::to_string(wait.count()) + " ms");
            }
        }
        
        clock_->sleepFor(wait);
    }
}

std::chrono::milliseconds RateLimiter::admissionDelayLocked(Timestamp now) {
    while (!calls_.empty() && calls_.front() + config_.window <= now) {
        calls_.pop_front();
    }
    
    Timestamp readyAt = now;
    
    if (backoffUntil_ && *backoffUntil_ > readyAt) {
        readyAt = *backoffUntil_;
    }
    if (lastCall_ && *lastCall_ + config_.minSpacing > readyAt) {
        readyAt = *lastCall_ + config_.minSpacing;
    }
    if (static_cast<int>(calls_.size()) >= config_.maxCallsPerWindow) {
        // The oldest call in the window has to age out first
        size_t index = calls_.size() - static_cast<size_t>(config_.maxCallsPerWindow);
        readyAt = std::max(readyAt, calls_[index] + config_.window);
    }
    
    return std::chrono::ceil<std::chrono::milliseconds>(readyAt - now);
}

void RateLimiter::applyBackoff() {
    Timestamp until;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        until = clock_->now() + config_.backoffDuration;
        if (backoffUntil_ && *backoffUntil_ > until) {
            until = *backoffUntil_;
        }
        backoffUntil_ = until;
    }
    
    std::cerr << "[RateLimiter] Provider rate limit hit, backing off until " << formatIso8601(until) << std::endl;
    if (stateStore_) {
        stateStore_->saveBackoffUntil(until);
    }
}

std::optional<Timestamp> RateLimiter::backoffUntil() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoffUntil_;
}

size_t RateLimiter::callsInWindow() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

} // namespace tripseg::provider
