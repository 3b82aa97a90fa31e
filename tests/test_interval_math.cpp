#include <iostream>
#include <string>
#include <vector>

#include "domain/IntervalMath.hpp"
#include "domain/Types.h"

int main() {
    using namespace domain;

    const auto oneSecond = interval_from_label("1s");
    const auto oneMinute = interval_from_label("1m");
    const auto oneHour = interval_from_label("1h");
    const auto oneWeek = interval_from_label("1w");
    const auto oneMonth = interval_from_label("1M");

    {
        if (oneMinute.ms != kMillisPerMinute || oneMonth.ms == oneMinute.ms) {
            std::cerr << "Interval labels must be case sensitive\n";
            return 1;
        }
        if (interval_from_label("7m").valid()) {
            std::cerr << "Unknown label must map to an invalid interval\n";
            return 1;
        }
        for (const auto& interval : all_intervals()) {
            if (interval_from_label(interval_label(interval)) != interval) {
                std::cerr << "Label lookup mismatch for " << interval_label(interval) << "\n";
                return 1;
            }
        }
    }

    {
        // Sub-second start on a 1s grid keeps the partially covered bar.
        const auto t = utc_timestamp(2024, 3, 1, 12, 0, 0);
        const auto window = adjust_request_window(t + 10'500, t + 15'000, oneSecond);
        if (window.start != t + 10'000 || window.end != t + 15'000) {
            std::cerr << "Unexpected 1s window [" << window.start << ", " << window.end << ")\n";
            return 1;
        }
        const auto times = expected_open_times(window, oneSecond);
        const std::vector<TimestampMs> want{t + 10'000, t + 11'000, t + 12'000, t + 13'000, t + 14'000};
        if (times != want || expected_count(window, oneSecond) != 5) {
            std::cerr << "Expected five 1s bars, got " << times.size() << "\n";
            return 1;
        }
    }

    {
        const auto t = utc_timestamp(2024, 3, 1, 12, 0, 0);
        for (const auto& interval : all_intervals()) {
            const auto first = adjust_request_window(t + 12'345, t + 40 * kMillisPerDay + 777, interval);
            const auto second = adjust_request_window(first.start, first.end, interval);
            if (first != second) {
                std::cerr << "Window adjustment is not idempotent for " << interval_label(interval) << "\n";
                return 1;
            }
            if (!is_aligned(first.start, interval) || !is_aligned(first.end, interval)) {
                std::cerr << "Adjusted window is not aligned for " << interval_label(interval) << "\n";
                return 1;
            }
        }
    }

    {
        // An end inside an open bar excludes that bar.
        const auto t = utc_timestamp(2024, 3, 1, 12, 0, 0);
        const auto window = adjust_request_window(t, t + 90 * kMillisPerMinute, oneHour);
        if (window.end != t + kMillisPerHour || expected_count(window, oneHour) != 1) {
            std::cerr << "Open 1h bar should be excluded from the window\n";
            return 1;
        }
        const auto empty = adjust_request_window(t + 1, t + 2, oneHour);
        if (!empty.empty() || expected_count(empty, oneHour) != 0) {
            std::cerr << "Window inside one bar should be empty\n";
            return 1;
        }
    }

    {
        // 2024-03-06 is a Wednesday; its week opened on Monday 2024-03-04.
        const auto wednesday = utc_timestamp(2024, 3, 6, 15, 30, 0);
        if (floor_to_interval(wednesday, oneWeek) != utc_timestamp(2024, 3, 4)) {
            std::cerr << "Weekly bars must open on Monday 00:00 UTC\n";
            return 1;
        }
        if (next_open_time(utc_timestamp(2024, 3, 4), oneWeek) != utc_timestamp(2024, 3, 11)) {
            std::cerr << "Unexpected next weekly open\n";
            return 1;
        }
    }

    {
        const auto midFebruary = utc_timestamp(2024, 2, 15, 8, 0, 0);
        if (floor_to_interval(midFebruary, oneMonth) != utc_timestamp(2024, 2, 1)) {
            std::cerr << "Monthly bars must open on the first of the month\n";
            return 1;
        }
        if (next_open_time(utc_timestamp(2024, 2, 1), oneMonth) != utc_timestamp(2024, 3, 1) ||
            next_open_time(utc_timestamp(2023, 12, 1), oneMonth) != utc_timestamp(2024, 1, 1)) {
            std::cerr << "Month stepping ignores calendar lengths\n";
            return 1;
        }
        if (close_time(utc_timestamp(2024, 2, 1), oneMonth) != utc_timestamp(2024, 3, 1) - 1) {
            std::cerr << "Leap February close time is wrong\n";
            return 1;
        }
        const TimeRange year{utc_timestamp(2024, 1, 1), utc_timestamp(2025, 1, 1)};
        if (expected_count(year, oneMonth) != 12) {
            std::cerr << "Expected 12 monthly bars in a year\n";
            return 1;
        }
        if (advance_open_time(utc_timestamp(2024, 1, 1), oneMonth, 14) != utc_timestamp(2025, 3, 1)) {
            std::cerr << "advance_open_time mismatch for months\n";
            return 1;
        }
    }

    {
        if (divides_day(oneWeek) || divides_day(interval_from_label("3d")) || !divides_day(oneSecond) ||
            !divides_day(interval_from_label("1d"))) {
            std::cerr << "divides_day classification is wrong\n";
            return 1;
        }
        const auto late = utc_timestamp(2024, 3, 1, 23, 59, 59) + 999;
        if (day_start(late) != utc_timestamp(2024, 3, 1) || day_start(-1) != -kMillisPerDay) {
            std::cerr << "day_start must floor towards negative infinity\n";
            return 1;
        }
    }

    {
        const auto parsed = parse_utc_timestamp("2024-03-01T12:34:56.789Z");
        if (!parsed || *parsed != utc_timestamp(2024, 3, 1, 12, 34, 56) + 789) {
            std::cerr << "Failed to parse ISO timestamp\n";
            return 1;
        }
        if (parse_utc_timestamp("2024-03-01") != utc_timestamp(2024, 3, 1) ||
            parse_utc_timestamp(" 1709251200000 ") != 1709251200000LL) {
            std::cerr << "Failed to parse date or epoch milliseconds\n";
            return 1;
        }
        if (parse_utc_timestamp("2024-13-01") || parse_utc_timestamp("2024-03-01T25:00") ||
            parse_utc_timestamp("yesterday")) {
            std::cerr << "Invalid timestamps must be rejected\n";
            return 1;
        }
        if (format_timestamp(*parsed) != "2024-03-01 12:34:56.789" || format_day(*parsed) != "20240301" ||
            format_date(*parsed) != "2024-03-01") {
            std::cerr << "Unexpected formatting of " << *parsed << "\n";
            return 1;
        }
    }

    return 0;
}
