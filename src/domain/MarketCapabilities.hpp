#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "domain/Types.h"

namespace domain {

struct MarketCapabilities {
    MarketType market{MarketType::Spot};
    std::size_t liveMaxRowsPerCall{1000};
    bool secondBars{false};

    // Interval is offered by the market at all.
    bool supports(const Interval& interval) const;

    // The bulk archive publishes daily files for the interval.
    bool bulkSupports(const Interval& interval) const;
};

const MarketCapabilities& capabilities_for(MarketType market);

std::optional<MarketType> market_from_string(std::string_view text);

}  // namespace domain
