#include "IClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tripseg {

int64_t IClock::epochSeconds() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        now().time_since_epoch()).count();
}

std::string IClock::iso8601() const {
    return formatIso8601(now());
}

int64_t toEpochMillis(Timestamp time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count();
}

Timestamp fromEpochMillis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

std::string formatIso8601(Timestamp time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t -= 1;
    }
    
    std::stringstream ss;
    
    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif
    
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

} // namespace tripseg
