#pragma once

#include "IClock.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tripseg {

/**
 * @brief Conversions between provider wall-clock text and UTC timestamps
 *
 * The provider reports and accepts "yyyy-MM-dd HH:mm:ss" in its own zone
 * (GMT+8 for GPS51). Numeric timestamps may be epoch milliseconds or epoch
 * seconds depending on the device firmware.
 */
class ProviderTime {
public:
    static constexpr std::chrono::minutes DEFAULT_UTC_OFFSET{8 * 60};
    
    /// Epoch milliseconds of 2000-01-01T00:00:00Z. Smaller numbers are taken as seconds.
    static constexpr int64_t YEAR_2000_EPOCH_MS = 946684800000LL;

    /**
     * @brief Parse "yyyy-MM-dd HH:mm:ss" (or ISO-8601 with 'T' and optional 'Z')
     * @param text Local wall-clock time
     * @param utcOffset Offset of the zone the text is expressed in
     * @return UTC timestamp, or nullopt if the text is malformed
     */
    static std::optional<Timestamp> parseDateTime(const std::string& text, std::chrono::minutes utcOffset);
    
    /// Format as "yyyy-MM-dd HH:mm:ss" in the zone given by utcOffset.
    static std::string formatDateTime(Timestamp time, std::chrono::minutes utcOffset);
    
    static Timestamp fromEpochNumber(int64_t value);
    
    /// True when time is not before 2000 and not further than tolerance ahead of now.
    static bool isPlausible(Timestamp time, Timestamp now, std::chrono::seconds futureTolerance);

private:
    static int64_t daysFromCivil(int64_t year, unsigned month, unsigned day);
    static void civilFromDays(int64_t days, int64_t& year, unsigned& month, unsigned& day);
};

} // namespace tripseg
