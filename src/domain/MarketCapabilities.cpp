#include "domain/MarketCapabilities.hpp"

#include <cctype>
#include <string>

#include "domain/IntervalMath.hpp"

namespace domain {
namespace {

const MarketCapabilities kSpot{MarketType::Spot, 1000, true};
const MarketCapabilities kFuturesUsdt{MarketType::FuturesUsdt, 1500, false};
const MarketCapabilities kFuturesCoin{MarketType::FuturesCoin, 1500, false};

}  // namespace

bool MarketCapabilities::supports(const Interval& interval) const {
    if (interval_label(interval).empty()) {
        return false;
    }
    if (interval.ms < kMillisPerMinute) {
        return secondBars;
    }
    return true;
}

bool MarketCapabilities::bulkSupports(const Interval& interval) const {
    return supports(interval) && divides_day(interval);
}

const MarketCapabilities& capabilities_for(MarketType market) {
    switch (market) {
    case MarketType::Spot:
        return kSpot;
    case MarketType::FuturesUsdt:
        return kFuturesUsdt;
    case MarketType::FuturesCoin:
        return kFuturesCoin;
    }
    return kSpot;
}

std::optional<MarketType> market_from_string(std::string_view text) {
    std::string lower;
    for (char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lower == "spot") {
        return MarketType::Spot;
    }
    if (lower == "um" || lower == "futures_usdt" || lower == "usdm") {
        return MarketType::FuturesUsdt;
    }
    if (lower == "cm" || lower == "futures_coin" || lower == "coinm") {
        return MarketType::FuturesCoin;
    }
    return std::nullopt;
}

}  // namespace domain
