#include "SimulatedClock.hpp"

namespace tripseg::sim {

SimulatedClock::SimulatedClock(Timestamp startTime)
    : simulatedTime_(startTime) {
}

Timestamp SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return simulatedTime_;
}

void SimulatedClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) return;
    
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
    totalSlept_ += duration;
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
}

void SimulatedClock::setCurrentTime(Timestamp time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
}

std::chrono::milliseconds SimulatedClock::totalSlept() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSlept_;
}

} // namespace tripseg::sim
