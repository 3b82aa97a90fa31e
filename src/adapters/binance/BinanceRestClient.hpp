#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "domain/MarketCapabilities.hpp"
#include "domain/exchange/IBarSource.hpp"
#include "adapters/binance/HttpTransport.hpp"

namespace adapters::binance {

// LIVE collaborator backed by the klines REST endpoint of the market.
class BinanceRestClient : public domain::IBarSource {
public:
    struct Options {
        domain::MarketType market{domain::MarketType::Spot};
        int timeoutSec{20};
        HttpGet http{};
    };

    explicit BinanceRestClient(Options options);
    ~BinanceRestClient() override = default;

    domain::SourceTag tag() const override { return domain::SourceTag::Live; }
    bool supports(const domain::Interval& interval) const override;
    std::size_t max_rows_per_call(const domain::Interval& interval) const override;

    domain::Result<std::vector<domain::Bar>> fetch_bars(const domain::Symbol& symbol,
                                                        const domain::Interval& interval,
                                                        const domain::TimeRange& range,
                                                        core::CancellationToken& cancel) override;

    // Rows of a klines response body, in response order. Throws
    // std::runtime_error on malformed input.
    static std::vector<domain::Bar> parse_klines(const std::string& body);

private:
    void throttle_(const std::string& usedWeightHeader);

    const Options options_;
    const domain::MarketCapabilities& market_;
    // steady_clock ticks before which no request is sent.
    std::atomic<long long> pauseUntil_{0};
};

}  // namespace adapters::binance
