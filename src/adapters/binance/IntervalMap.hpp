#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace adapters::binance {

// Kline label for `interval`; throws std::invalid_argument when the market
// does not offer it (1s bars exist on spot only).
std::string binance_interval(domain::MarketType market, domain::Interval interval);

namespace detail {

struct Literal {
    std::string_view text;
    domain::Interval interval;
};

constexpr Literal kLiterals[] = {
    {"1s", domain::Interval{domain::kMillisPerSecond}},
    {"1m", domain::Interval{domain::kMillisPerMinute}},
    {"3m", domain::Interval{3 * domain::kMillisPerMinute}},
    {"5m", domain::Interval{5 * domain::kMillisPerMinute}},
    {"15m", domain::Interval{15 * domain::kMillisPerMinute}},
    {"30m", domain::Interval{30 * domain::kMillisPerMinute}},
    {"1h", domain::Interval{domain::kMillisPerHour}},
    {"2h", domain::Interval{2 * domain::kMillisPerHour}},
    {"4h", domain::Interval{4 * domain::kMillisPerHour}},
    {"6h", domain::Interval{6 * domain::kMillisPerHour}},
    {"8h", domain::Interval{8 * domain::kMillisPerHour}},
    {"12h", domain::Interval{12 * domain::kMillisPerHour}},
    {"1d", domain::Interval{domain::kMillisPerDay}},
    {"3d", domain::Interval{3 * domain::kMillisPerDay}},
    {"1w", domain::Interval{7 * domain::kMillisPerDay, domain::CalendarUnit::Week}},
    {"1M", domain::Interval{30 * domain::kMillisPerDay, domain::CalendarUnit::Month}},
};

constexpr std::string_view binance_interval_literal(domain::Interval interval) {
    for (const auto &literal : kLiterals) {
        if (literal.interval == interval) {
            return literal.text;
        }
    }
    throw std::invalid_argument("Unsupported domain interval");
}

constexpr domain::Interval from_binance_interval_literal(std::string_view value) {
    for (const auto &literal : kLiterals) {
        if (literal.text == value) {
            return literal.interval;
        }
    }
    throw std::invalid_argument("Unsupported Binance interval");
}

} // namespace detail

static_assert(detail::binance_interval_literal(domain::Interval{60'000}) == std::string_view{"1m"});
static_assert(detail::binance_interval_literal(domain::Interval{5 * 60'000}) == std::string_view{"5m"});
static_assert(detail::from_binance_interval_literal("1h").ms == 60 * 60'000);
static_assert(detail::from_binance_interval_literal("1d").ms == 24 * 60 * 60'000);
static_assert(detail::from_binance_interval_literal("1M").calendar == domain::CalendarUnit::Month);
static_assert(detail::from_binance_interval_literal("1w").calendar == domain::CalendarUnit::Week);

} // namespace adapters::binance
