#pragma once

#include <chrono>

namespace tripseg::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;
    
    // Spacing between retries of a rate-limited provider call
    virtual const RetryPolicy& getRateLimitRetryPolicy() const = 0;
    // Spacing between retries after a network failure
    virtual const RetryPolicy& getNetworkRetryPolicy() const = 0;
};

} // namespace tripseg::ports
