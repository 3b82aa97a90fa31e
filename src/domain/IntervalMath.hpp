#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Types.h"

namespace domain {

// Largest interval boundary <= t.
TimestampMs floor_to_interval(TimestampMs t, const Interval& interval);

// Smallest interval boundary >= t; t itself when already aligned.
TimestampMs ceil_to_interval(TimestampMs t, const Interval& interval);

bool is_aligned(TimestampMs t, const Interval& interval);

// Open time of the bar following the one opening at `openTime` (which must be aligned).
TimestampMs next_open_time(TimestampMs openTime, const Interval& interval);

// Moves an aligned open time forward by `steps` bars.
TimestampMs advance_open_time(TimestampMs openTime, const Interval& interval, std::size_t steps);

TimestampMs close_time(TimestampMs openTime, const Interval& interval);

// Start is floored so no closed bar is lost; end is floored and exclusive so
// a bar that has not closed yet is never requested.
TimeRange adjust_request_window(TimestampMs start, TimestampMs end, const Interval& interval);

// Number of bar open times b with range.start <= b < range.end.
std::size_t expected_count(const TimeRange& range, const Interval& interval);

std::vector<TimestampMs> expected_open_times(const TimeRange& range, const Interval& interval);

TimestampMs day_start(TimestampMs t);

// True for intervals whose bars tile a UTC day exactly (1s .. 1d).
bool divides_day(const Interval& interval);

// "YYYYMMDD" for the UTC day holding t.
std::string format_day(TimestampMs t);

// "YYYY-MM-DD" for the UTC day holding t.
std::string format_date(TimestampMs t);

// "YYYY-MM-DD HH:MM:SS.mmm" UTC.
std::string format_timestamp(TimestampMs t);

// Accepts epoch milliseconds, "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS]" or the
// same with a space separator, all UTC.
std::optional<TimestampMs> parse_utc_timestamp(std::string_view text);

TimestampMs utc_timestamp(int year, unsigned month, unsigned day, int hour = 0, int minute = 0, int second = 0);

}  // namespace domain
