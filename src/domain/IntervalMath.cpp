#include "domain/IntervalMath.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace domain {
namespace {

constexpr TimestampMs kWeekMs = 7 * kMillisPerDay;
// 1970-01-01 was a Thursday; the first Monday is four days later.
constexpr TimestampMs kWeekOffsetMs = 4 * kMillisPerDay;

struct CivilDate {
    long long year;
    unsigned month;
    unsigned day;
};

TimestampMs floorDiv(TimestampMs a, TimestampMs b) {
    TimestampMs q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

CivilDate civilFromDays(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{y + (m <= 2 ? 1 : 0), m, d};
}

CivilDate civilFromTimestamp(TimestampMs t) { return civilFromDays(floorDiv(t, kMillisPerDay)); }

TimestampMs monthStart(long long year, unsigned month) {
    return daysFromCivil(year, month, 1) * kMillisPerDay;
}

void requireValid(const Interval& interval) {
    if (!interval.valid()) {
        throw std::invalid_argument("interval must have a positive duration");
    }
}

bool readNumber(std::string_view text, std::size_t& pos, std::size_t digits, int& out) {
    if (pos + digits > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        const char ch = text[pos + i];
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    pos += digits;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char ch) {
    if (pos < text.size() && text[pos] == ch) {
        ++pos;
        return true;
    }
    return false;
}

}  // namespace

TimestampMs floor_to_interval(TimestampMs t, const Interval& interval) {
    requireValid(interval);
    switch (interval.calendar) {
    case CalendarUnit::None:
        return floorDiv(t, interval.ms) * interval.ms;
    case CalendarUnit::Week:
        return floorDiv(t - kWeekOffsetMs, kWeekMs) * kWeekMs + kWeekOffsetMs;
    case CalendarUnit::Month: {
        const auto date = civilFromTimestamp(t);
        return monthStart(date.year, date.month);
    }
    }
    throw std::invalid_argument("unknown calendar unit");
}

TimestampMs ceil_to_interval(TimestampMs t, const Interval& interval) {
    const auto floored = floor_to_interval(t, interval);
    return floored == t ? t : next_open_time(floored, interval);
}

bool is_aligned(TimestampMs t, const Interval& interval) { return floor_to_interval(t, interval) == t; }

TimestampMs next_open_time(TimestampMs openTime, const Interval& interval) {
    requireValid(interval);
    if (!interval.calendarMonth()) {
        return openTime + interval.ms;
    }
    const auto date = civilFromTimestamp(openTime);
    if (date.month == 12) {
        return monthStart(date.year + 1, 1);
    }
    return monthStart(date.year, date.month + 1);
}

TimestampMs advance_open_time(TimestampMs openTime, const Interval& interval, std::size_t steps) {
    if (!interval.calendarMonth()) {
        requireValid(interval);
        return openTime + static_cast<TimestampMs>(steps) * interval.ms;
    }
    auto cursor = openTime;
    for (std::size_t i = 0; i < steps; ++i) {
        cursor = next_open_time(cursor, interval);
    }
    return cursor;
}

TimestampMs close_time(TimestampMs openTime, const Interval& interval) {
    return next_open_time(openTime, interval) - 1;
}

TimeRange adjust_request_window(TimestampMs start, TimestampMs end, const Interval& interval) {
    TimeRange adjusted{};
    adjusted.start = floor_to_interval(start, interval);
    adjusted.end = floor_to_interval(end, interval);
    if (adjusted.end < adjusted.start) {
        adjusted.end = adjusted.start;
    }
    return adjusted;
}

std::size_t expected_count(const TimeRange& range, const Interval& interval) {
    if (range.empty()) {
        return 0;
    }
    const auto first = ceil_to_interval(range.start, interval);
    if (first >= range.end) {
        return 0;
    }
    if (!interval.calendarMonth()) {
        return static_cast<std::size_t>((range.end - 1 - first) / interval.ms) + 1;
    }
    std::size_t count = 0;
    for (auto t = first; t < range.end; t = next_open_time(t, interval)) {
        ++count;
    }
    return count;
}

std::vector<TimestampMs> expected_open_times(const TimeRange& range, const Interval& interval) {
    std::vector<TimestampMs> out;
    if (range.empty()) {
        return out;
    }
    out.reserve(expected_count(range, interval));
    for (auto t = ceil_to_interval(range.start, interval); t < range.end; t = next_open_time(t, interval)) {
        out.push_back(t);
    }
    return out;
}

TimestampMs day_start(TimestampMs t) { return floorDiv(t, kMillisPerDay) * kMillisPerDay; }

bool divides_day(const Interval& interval) {
    return interval.valid() && interval.calendar == CalendarUnit::None && interval.ms <= kMillisPerDay &&
           kMillisPerDay % interval.ms == 0;
}

std::string format_day(TimestampMs t) {
    const auto date = civilFromTimestamp(t);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04lld%02u%02u", date.year, date.month, date.day);
    return buffer;
}

std::string format_date(TimestampMs t) {
    const auto date = civilFromTimestamp(t);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", date.year, date.month, date.day);
    return buffer;
}

std::string format_timestamp(TimestampMs t) {
    const auto date = civilFromTimestamp(t);
    const auto msOfDay = t - day_start(t);
    const auto hours = msOfDay / kMillisPerHour;
    const auto minutes = (msOfDay % kMillisPerHour) / kMillisPerMinute;
    const auto seconds = (msOfDay % kMillisPerMinute) / kMillisPerSecond;
    const auto millis = msOfDay % kMillisPerSecond;
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u %02lld:%02lld:%02lld.%03lld", date.year, date.month,
                  date.day, hours, minutes, seconds, millis);
    return buffer;
}

std::optional<TimestampMs> parse_utc_timestamp(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    bool allDigits = true;
    for (char ch : text) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            allDigits = false;
            break;
        }
    }
    if (allDigits) {
        try {
            return static_cast<TimestampMs>(std::stoll(std::string{text}));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::size_t pos = 0;
    int year = 0;
    int month = 0;
    int day = 0;
    if (!readNumber(text, pos, 4, year) || !expect(text, pos, '-') || !readNumber(text, pos, 2, month) ||
        !expect(text, pos, '-') || !readNumber(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!readNumber(text, pos, 2, hour) || !expect(text, pos, ':') || !readNumber(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (expect(text, pos, ':')) {
            if (!readNumber(text, pos, 2, second)) {
                return std::nullopt;
            }
            if (expect(text, pos, '.')) {
                if (!readNumber(text, pos, 3, millis)) {
                    return std::nullopt;
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 59) {
            return std::nullopt;
        }
    }
    expect(text, pos, 'Z');
    if (pos != text.size()) {
        return std::nullopt;
    }

    return utc_timestamp(year, static_cast<unsigned>(month), static_cast<unsigned>(day), hour, minute, second) +
           millis;
}

TimestampMs utc_timestamp(int year, unsigned month, unsigned day, int hour, int minute, int second) {
    return daysFromCivil(year, month, day) * kMillisPerDay + hour * kMillisPerHour + minute * kMillisPerMinute +
           second * kMillisPerSecond;
}

}  // namespace domain
