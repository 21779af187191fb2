#include "common/MarketClock.h"

#include <cctype>
#include <chrono>
#include <cstdio>

namespace daypilot {

namespace {

constexpr long long kSecondsPerDay = 86400;

// Howard Hinnant's days_from_civil / civil_from_days
long long daysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long year = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(year + (m <= 2));
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) return 29;
    return kDays[m - 1];
}

bool readDigits(const std::string& text, size_t& pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += count;
    return true;
}

bool expectChar(const std::string& text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

std::string trimCopy(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

MarketClock::MarketClock(int utc_offset_minutes)
    : utc_offset_minutes_(utc_offset_minutes) {}

LocalTime MarketClock::toLocal(TimestampMs ts) const {
    const long long local_seconds = floorDiv(ts, 1000) + static_cast<long long>(utc_offset_minutes_) * 60;
    const long long days = floorDiv(local_seconds, kSecondsPerDay);
    const long long sod = local_seconds - days * kSecondsPerDay;

    int y = 0, m = 0, d = 0;
    civilFromDays(days, y, m, d);

    LocalTime out;
    out.date = y * 10000 + m * 100 + d;
    out.second_of_day = static_cast<int>(sod);
    out.minute_of_day = static_cast<int>(sod / 60);
    out.weekday = static_cast<int>(((days % 7) + 7 + 3) % 7);  // 1970-01-01 was a Thursday
    return out;
}

TimestampMs MarketClock::fromLocal(int year, int month, int day, int hour, int minute, int second) const {
    const long long days = daysFromCivil(year, month, day);
    const long long seconds = days * kSecondsPerDay + hour * 3600LL + minute * 60LL + second
                              - static_cast<long long>(utc_offset_minutes_) * 60;
    return seconds * 1000;
}

std::optional<TimestampMs> MarketClock::parseTimestamp(const std::string& raw) const {
    const std::string text = trimCopy(raw);
    size_t pos = 0;
    int y = 0, mo = 0, d = 0;
    if (!readDigits(text, pos, 4, y) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, mo) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, d)) {
        return std::nullopt;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > daysInMonth(y, mo)) {
        return std::nullopt;
    }

    int hh = 0, mi = 0, ss = 0, ms = 0;
    if (pos < text.size()) {
        if (text[pos] != ' ' && text[pos] != 'T') return std::nullopt;
        ++pos;
        if (!readDigits(text, pos, 2, hh) || !expectChar(text, pos, ':') || !readDigits(text, pos, 2, mi)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!readDigits(text, pos, 2, ss)) return std::nullopt;
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                int digits = 0;
                int frac = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    if (digits < 3) {
                        frac = frac * 10 + (text[pos] - '0');
                        ++digits;
                    }
                    ++pos;
                }
                if (digits == 0) return std::nullopt;
                while (digits < 3) {
                    frac *= 10;
                    ++digits;
                }
                ms = frac;
            }
        }
        if (hh > 23 || mi > 59 || ss > 59) return std::nullopt;
    }

    int offset_minutes = utc_offset_minutes_;
    if (pos < text.size()) {
        const char sign = text[pos];
        if (sign == 'Z') {
            offset_minutes = 0;
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!readDigits(text, pos, 2, oh)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') ++pos;
            if (!readDigits(text, pos, 2, om)) return std::nullopt;
            offset_minutes = (oh * 60 + om) * (sign == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    const long long days = daysFromCivil(y, mo, d);
    const long long seconds = days * kSecondsPerDay + hh * 3600LL + mi * 60LL + ss
                              - static_cast<long long>(offset_minutes) * 60;
    return seconds * 1000 + ms;
}

std::string MarketClock::formatIso(TimestampMs ts) const {
    const LocalTime local = toLocal(ts);
    const int sod = local.second_of_day;
    const int abs_offset = utc_offset_minutes_ < 0 ? -utc_offset_minutes_ : utc_offset_minutes_;
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d%c%02d:%02d",
                  local.date / 10000, (local.date / 100) % 100, local.date % 100,
                  sod / 3600, (sod / 60) % 60, sod % 60,
                  utc_offset_minutes_ < 0 ? '-' : '+', abs_offset / 60, abs_offset % 60);
    return buffer;
}

std::optional<int> MarketClock::parseClockTime(const std::string& raw) {
    const std::string text = trimCopy(raw);
    size_t pos = 0;
    int hh = 0, mm = 0;
    if (!readDigits(text, pos, 2, hh) || !expectChar(text, pos, ':') || !readDigits(text, pos, 2, mm)) {
        return std::nullopt;
    }
    if (pos != text.size() || hh > 23 || mm > 59) return std::nullopt;
    return hh * 60 + mm;
}

std::optional<int> MarketClock::parseDate(const std::string& raw) {
    const std::string text = trimCopy(raw);
    size_t pos = 0;
    int y = 0, m = 0, d = 0;
    if (!readDigits(text, pos, 4, y) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, m) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, d) || pos != text.size()) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) return std::nullopt;
    return y * 10000 + m * 100 + d;
}

TimestampMs MarketClock::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ===== MarketCalendar =====

MarketCalendar::MarketCalendar(CalendarConfig config)
    : config_(std::move(config))
    , clock_(config_.utc_offset_minutes)
{}

bool MarketCalendar::isHoliday(int yyyymmdd) const {
    return config_.holidays.count(yyyymmdd) > 0;
}

bool MarketCalendar::isTradingSessionNow(TimestampMs now) const {
    if (config_.weekend_testing) {
        return true;
    }

    const LocalTime local = clock_.toLocal(now);
    const bool is_weekday = local.weekday < 5;
    const bool not_holiday = !isHoliday(local.date);
    const int second = local.second_of_day;
    const bool within_hours = second >= config_.session_open_minute * 60 &&
                              second <= config_.session_close_minute * 60;
    return is_weekday && not_holiday && within_hours;
}

} // namespace daypilot
