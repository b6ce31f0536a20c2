#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace tripseg {

using Timestamp = std::chrono::system_clock::time_point;

class IClock {
public:
    virtual ~IClock() = default;
    
    virtual Timestamp now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;

    int64_t epochSeconds() const;
    std::string iso8601() const;
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
    
    void sleepFor(std::chrono::milliseconds duration) override {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
};

int64_t toEpochMillis(Timestamp time);
Timestamp fromEpochMillis(int64_t millis);
std::string formatIso8601(Timestamp time);

} // namespace tripseg
