#pragma once

#include "domain/Types.h"

namespace adapters::binance {

constexpr const char* kVisionHost = "data.binance.vision";

struct RestEndpoint {
    const char* host;
    const char* klinesPath;
};

constexpr RestEndpoint rest_endpoint(domain::MarketType market) {
    switch (market) {
    case domain::MarketType::Spot:
        return RestEndpoint{"api.binance.com", "/api/v3/klines"};
    case domain::MarketType::FuturesUsdt:
        return RestEndpoint{"fapi.binance.com", "/fapi/v1/klines"};
    case domain::MarketType::FuturesCoin:
        return RestEndpoint{"dapi.binance.com", "/dapi/v1/klines"};
    }
    return RestEndpoint{"api.binance.com", "/api/v3/klines"};
}

// Market directory under https://data.binance.vision/data/.
constexpr const char* vision_market_path(domain::MarketType market) {
    switch (market) {
    case domain::MarketType::Spot:
        return "spot";
    case domain::MarketType::FuturesUsdt:
        return "futures/um";
    case domain::MarketType::FuturesCoin:
        return "futures/cm";
    }
    return "spot";
}

}  // namespace adapters::binance
