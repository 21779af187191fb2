#pragma once

#include "common/Types.h"

#include <optional>
#include <set>
#include <string>

namespace daypilot {

struct LocalTime {
    int date = 0;            // YYYYMMDD
    int minute_of_day = 0;
    int second_of_day = 0;
    int weekday = 0;         // 0 = Monday ... 6 = Sunday
};

// Exchange-local view of epoch timestamps. The exchange uses a fixed UTC
// offset (no DST), +05:30 by default.
class MarketClock {
public:
    explicit MarketClock(int utc_offset_minutes = 330);

    int utcOffsetMinutes() const { return utc_offset_minutes_; }

    LocalTime toLocal(TimestampMs ts) const;
    int localDate(TimestampMs ts) const { return toLocal(ts).date; }
    int minuteOfDay(TimestampMs ts) const { return toLocal(ts).minute_of_day; }

    // Accepts "YYYY-MM-DD[ |T]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]" or a bare date.
    // Text without an offset is exchange-local time.
    std::optional<TimestampMs> parseTimestamp(const std::string& text) const;

    TimestampMs fromLocal(int year, int month, int day, int hour, int minute, int second = 0) const;
    std::string formatIso(TimestampMs ts) const;

    // "HH:MM" -> minutes after midnight
    static std::optional<int> parseClockTime(const std::string& text);
    // "YYYY-MM-DD" -> YYYYMMDD
    static std::optional<int> parseDate(const std::string& text);

    static TimestampMs nowMs();

private:
    int utc_offset_minutes_;
};

struct CalendarConfig {
    int utc_offset_minutes = 330;
    int session_open_minute = 9 * 60 + 15;
    int session_close_minute = 15 * 60 + 30;
    std::set<int> holidays;     // YYYYMMDD
    bool weekend_testing = false;
};

class MarketCalendar {
public:
    explicit MarketCalendar(CalendarConfig config);

    bool isTradingSessionNow(TimestampMs now) const;
    bool isHoliday(int yyyymmdd) const;
    const MarketClock& clock() const { return clock_; }

private:
    CalendarConfig config_;
    MarketClock clock_;
};

} // namespace daypilot
