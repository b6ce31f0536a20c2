#pragma once

#include "../ports/IPolicyEngine.hpp"
#include <algorithm>
#include <cmath>

namespace tripseg::adapters {

class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(2000),
                                double multiplier = 3.0,
                                std::chrono::milliseconds maxDelay = std::chrono::seconds(60),
                                int maxAttempts = 3)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        auto delay = std::chrono::milliseconds(static_cast<long long>(
            baseDelay_.count() * std::pow(multiplier_, std::max(attemptCount, 1) - 1)));
        return std::min(delay, maxDelay_);
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

    int maxAttempts() const { return maxAttempts_; }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    DefaultPolicyEngine() = default;
    
    explicit DefaultPolicyEngine(ExponentialBackoffRetryPolicy retryPolicy)
        : rateLimitPolicy_(retryPolicy), networkPolicy_(retryPolicy) {}

    const ports::RetryPolicy& getRateLimitRetryPolicy() const override {
        return rateLimitPolicy_;
    }

    const ports::RetryPolicy& getNetworkRetryPolicy() const override {
        return networkPolicy_;
    }

private:
    ExponentialBackoffRetryPolicy rateLimitPolicy_;
    ExponentialBackoffRetryPolicy networkPolicy_;
};

} // namespace tripseg::adapters
