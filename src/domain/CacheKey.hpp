#pragma once

#include <string>

#include "domain/IntervalMath.hpp"
#include "domain/Types.h"

namespace domain {

// One persisted cache unit: a UTC day of bars for one symbol and interval.
struct CacheKey {
    DataProvider provider{DataProvider::Binance};
    MarketType market{MarketType::Spot};
    Symbol symbol;
    Interval interval{};
    TimestampMs dayStart{0};

    std::string id() const;
};

inline std::string CacheKey::id() const {
    std::string out;
    auto upper = [](std::string text) {
        for (auto& ch : text) {
            if (ch >= 'a' && ch <= 'z') {
                ch = static_cast<char>(ch - 'a' + 'A');
            }
        }
        return text;
    };
    out += upper(to_string(provider));
    out += "_KLINES_";
    out += upper(to_string(market));
    out += '_';
    out += symbol;
    out += '_';
    out += interval_label(interval);
    out += '_';
    out += format_day(dayStart);
    return out;
}

}  // namespace domain
