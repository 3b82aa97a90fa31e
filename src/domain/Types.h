#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using TimestampMs = long long;
using Symbol = std::string;

constexpr TimestampMs kMillisPerSecond = 1'000;
constexpr TimestampMs kMillisPerMinute = 60'000;
constexpr TimestampMs kMillisPerHour = 3'600'000;
constexpr TimestampMs kMillisPerDay = 86'400'000;

// Weeks open on Monday 00:00 UTC and months on the first day of the month.
// Every other interval opens on an epoch multiple of its duration.
enum class CalendarUnit : std::uint8_t {
    None,
    Week,
    Month,
};

struct Interval {
    // Nominal duration; for months this is a 30 day estimate used only for sizing.
    TimestampMs ms{0};
    CalendarUnit calendar{CalendarUnit::None};

    constexpr bool valid() const noexcept { return ms > 0; }
    constexpr bool calendarMonth() const noexcept { return calendar == CalendarUnit::Month; }
};

constexpr bool operator==(const Interval& lhs, const Interval& rhs) noexcept {
    return lhs.ms == rhs.ms && lhs.calendar == rhs.calendar;
}

constexpr bool operator!=(const Interval& lhs, const Interval& rhs) noexcept { return !(lhs == rhs); }

struct TimeRange {
    TimestampMs start{0};
    TimestampMs end{0};

    bool empty() const noexcept { return end <= start; }
    bool contains(TimestampMs t) const noexcept { return t >= start && t < end; }
};

inline bool operator==(const TimeRange& lhs, const TimeRange& rhs) noexcept {
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const TimeRange& lhs, const TimeRange& rhs) noexcept { return !(lhs == rhs); }

struct Bar {
    TimestampMs openTime{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
};

inline bool operator==(const Bar& lhs, const Bar& rhs) noexcept {
    return lhs.openTime == rhs.openTime && lhs.open == rhs.open && lhs.high == rhs.high &&
           lhs.low == rhs.low && lhs.close == rhs.close && lhs.volume == rhs.volume;
}

inline bool operator!=(const Bar& lhs, const Bar& rhs) noexcept { return !(lhs == rhs); }

enum class SourceTag : std::uint8_t {
    Cache,
    BulkHistorical,
    Live,
};

// Lower rank wins a collision on the same open time.
constexpr int priority_rank(SourceTag tag) noexcept {
    switch (tag) {
    case SourceTag::Cache:
        return 0;
    case SourceTag::BulkHistorical:
        return 1;
    case SourceTag::Live:
        return 2;
    }
    return 3;
}

inline const char* to_string(SourceTag tag) noexcept {
    switch (tag) {
    case SourceTag::Cache:
        return "CACHE";
    case SourceTag::BulkHistorical:
        return "BULK_HISTORICAL";
    case SourceTag::Live:
        return "LIVE";
    }
    return "UNKNOWN";
}

struct SourcedBar {
    Bar bar;
    SourceTag source{SourceTag::Live};
};

enum class MarketType : std::uint8_t {
    Spot,
    FuturesUsdt,
    FuturesCoin,
};

inline const char* to_string(MarketType market) noexcept {
    switch (market) {
    case MarketType::Spot:
        return "spot";
    case MarketType::FuturesUsdt:
        return "futures_usdt";
    case MarketType::FuturesCoin:
        return "futures_coin";
    }
    return "unknown";
}

enum class DataProvider : std::uint8_t {
    Binance,
};

inline const char* to_string(DataProvider provider) noexcept {
    switch (provider) {
    case DataProvider::Binance:
        return "binance";
    }
    return "unknown";
}

namespace detail {

struct IntervalLabel {
    std::string_view label;
    Interval interval;
};

constexpr IntervalLabel kIntervalLabels[] = {
    {"1s", Interval{kMillisPerSecond}},
    {"1m", Interval{kMillisPerMinute}},
    {"3m", Interval{3 * kMillisPerMinute}},
    {"5m", Interval{5 * kMillisPerMinute}},
    {"15m", Interval{15 * kMillisPerMinute}},
    {"30m", Interval{30 * kMillisPerMinute}},
    {"1h", Interval{kMillisPerHour}},
    {"2h", Interval{2 * kMillisPerHour}},
    {"4h", Interval{4 * kMillisPerHour}},
    {"6h", Interval{6 * kMillisPerHour}},
    {"8h", Interval{8 * kMillisPerHour}},
    {"12h", Interval{12 * kMillisPerHour}},
    {"1d", Interval{kMillisPerDay}},
    {"3d", Interval{3 * kMillisPerDay}},
    {"1w", Interval{7 * kMillisPerDay, CalendarUnit::Week}},
    {"1M", Interval{30 * kMillisPerDay, CalendarUnit::Month}},
};

}  // namespace detail

// Labels are case sensitive: "1m" is one minute, "1M" one month.
inline std::string interval_label(const Interval& interval) {
    for (const auto& entry : detail::kIntervalLabels) {
        if (entry.interval == interval) {
            return std::string{entry.label};
        }
    }
    return "";
}

inline Interval interval_from_label(std::string_view label) {
    for (const auto& entry : detail::kIntervalLabels) {
        if (entry.label == label) {
            return entry.interval;
        }
    }
    return Interval{};
}

inline std::vector<Interval> all_intervals() {
    std::vector<Interval> out;
    for (const auto& entry : detail::kIntervalLabels) {
        out.push_back(entry.interval);
    }
    return out;
}

}  // namespace domain
