#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>

namespace tripseg::sim {

// Deterministic clock for tests. Sleeping advances simulated time instead of blocking.
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(Timestamp startTime = Timestamp(std::chrono::seconds(1709251200)));
    ~SimulatedClock() override = default;

    // IClock interface
    Timestamp now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(Timestamp time);

    std::chrono::milliseconds totalSlept() const;

private:
    mutable std::mutex mutex_;
    Timestamp simulatedTime_;
    std::chrono::milliseconds totalSlept_{0};
};

} // namespace tripseg::sim
