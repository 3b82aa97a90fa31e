#include "adapters/binance/IntervalMap.hpp"

#include "domain/MarketCapabilities.hpp"

namespace adapters::binance {

std::string binance_interval(domain::MarketType market, domain::Interval interval) {
    if (!domain::capabilities_for(market).supports(interval)) {
        throw std::invalid_argument("interval " + domain::interval_label(interval) + " is not offered on " +
                                    domain::to_string(market));
    }
    return std::string(detail::binance_interval_literal(interval));
}

} // namespace adapters::binance
