#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "adapters/binance/HttpTransport.hpp"
#include "domain/MarketCapabilities.hpp"
#include "domain/exchange/IBarSource.hpp"

namespace adapters::binance {

// BULK_HISTORICAL collaborator reading the daily kline archives published
// on data.binance.vision. Each call downloads one zip (plus its .CHECKSUM)
// per UTC day touched by the requested range.
class VisionClient : public domain::IBarSource {
public:
    using NowFn = std::function<domain::TimestampMs()>;

    struct Options {
        domain::MarketType market{domain::MarketType::Spot};
        int timeoutSec{60};
        // Missing files younger than this are reported as NotYetAvailable.
        std::chrono::milliseconds freshnessDelay{std::chrono::hours(48)};
        bool verifyChecksum{true};
        NowFn now{};
        HttpGet http{};
    };

    explicit VisionClient(Options options);
    ~VisionClient() override = default;

    domain::SourceTag tag() const override { return domain::SourceTag::BulkHistorical; }
    bool supports(const domain::Interval& interval) const override;
    std::size_t max_rows_per_call(const domain::Interval& interval) const override;

    domain::Result<std::vector<domain::Bar>> fetch_bars(const domain::Symbol& symbol,
                                                        const domain::Interval& interval,
                                                        const domain::TimeRange& range,
                                                        core::CancellationToken& cancel) override;

    // Path of the archive for one UTC day, relative to the Vision host.
    std::string archive_target(const domain::Symbol& symbol,
                               const domain::Interval& interval,
                               domain::TimestampMs dayStart) const;

    // Rows of a kline CSV. An optional header line is skipped and
    // microsecond timestamps are converted to milliseconds. Throws
    // std::runtime_error on malformed rows.
    static std::vector<domain::Bar> parse_csv(std::string_view text);

    // Hex digest from a "<sha256>  <file name>" checksum file.
    static std::optional<std::string> parse_checksum(std::string_view text);

private:
    domain::Result<std::vector<domain::Bar>> fetchDay_(const domain::Symbol& symbol,
                                                       const domain::Interval& interval,
                                                       domain::TimestampMs dayStart,
                                                       core::CancellationToken& cancel);
    domain::FetchError classifyStatus_(unsigned status, domain::TimestampMs dayStart, const std::string& what) const;
    infra::http::HttpResponse get_(const std::string& target, core::CancellationToken& cancel) const;
    domain::TimestampMs now_() const;

    const Options options_;
    const domain::MarketCapabilities& market_;
};

}  // namespace adapters::binance
