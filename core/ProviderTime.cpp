#include "ProviderTime.hpp"
#include <cstdio>

namespace tripseg {

std::optional<Timestamp> ProviderTime::parseDateTime(const std::string& text, std::chrono::minutes utcOffset) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char separator = 0;
    
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d",
                             &year, &month, &day, &separator, &hour, &minute, &second);
    if (fields == 3) {
        separator = ' ';
    } else if (fields < 6) {
        return std::nullopt;
    }
    
    if (separator != ' ' && separator != 'T') {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        return std::nullopt;
    }
    
    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t localSeconds = days * 86400 + hour * 3600 + minute * 60 + second;
    
    // A trailing 'Z' pins the text to UTC regardless of the configured zone
    bool isUtc = !text.empty() && text.back() == 'Z';
    int64_t offsetSeconds = isUtc ? 0 : std::chrono::duration_cast<std::chrono::seconds>(utcOffset).count();
    
    return Timestamp(std::chrono::seconds(localSeconds - offsetSeconds));
}

std::string ProviderTime::formatDateTime(Timestamp time, std::chrono::minutes utcOffset) {
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    seconds += std::chrono::duration_cast<std::chrono::seconds>(utcOffset).count();
    
    int64_t days = seconds / 86400;
    int64_t secondOfDay = seconds % 86400;
    if (secondOfDay < 0) {
        secondOfDay += 86400;
        days -= 1;
    }
    
    int64_t year = 0;
    unsigned month = 0, day = 0;
    civilFromDays(days, year, month, day);
    
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u %02lld:%02lld:%02lld",
                  static_cast<long long>(year), month, day,
                  static_cast<long long>(secondOfDay / 3600),
                  static_cast<long long>((secondOfDay % 3600) / 60),
                  static_cast<long long>(secondOfDay % 60));
    return buffer;
}

Timestamp ProviderTime::fromEpochNumber(int64_t value) {
    if (value < YEAR_2000_EPOCH_MS) {
        return Timestamp(std::chrono::seconds(value));
    }
    return fromEpochMillis(value);
}

bool ProviderTime::isPlausible(Timestamp time, Timestamp now, std::chrono::seconds futureTolerance) {
    if (toEpochMillis(time) < YEAR_2000_EPOCH_MS) {
        return false;
    }
    return time <= now + futureTolerance;
}

// Howard Hinnant's civil calendar algorithms
int64_t ProviderTime::daysFromCivil(int64_t year, unsigned month, unsigned day) {
    year -= month <= 2;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void ProviderTime::civilFromDays(int64_t days, int64_t& year, unsigned& month, unsigned& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int64_t>(yoe) + era * 400 + (month <= 2);
}

} // namespace tripseg
