#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "app/FcpConfig.hpp"
#include "app/FetchCoordinator.hpp"
#include "app/MergeEngine.hpp"
#include "app/RangePlanner.hpp"
#include "core/CancellationToken.hpp"
#include "domain/DomainContracts.h"
#include "domain/MarketCapabilities.hpp"
#include "domain/Types.h"
#include "domain/exchange/IBarSource.hpp"
#include "infra/storage/DailyBarCache.hpp"

namespace app {

struct GetDataOptions {
    // Serve the request from this source only: no cache reads for BULK/LIVE,
    // no fallback and nothing persisted.
    std::optional<domain::SourceTag> enforceSource{};
    // Fill BarSeries::sources with the provenance of every bar.
    bool includeSources{false};
    std::optional<std::chrono::milliseconds> freshnessDelay{};
    // Cancelling this token aborts the request.
    std::shared_ptr<core::CancellationToken> cancel{};
};

struct BarSeries {
    domain::Symbol symbol;
    domain::Interval interval{};
    domain::TimeRange range{};
    std::vector<domain::Bar> bars;
    std::vector<domain::SourceTag> sources;
    std::vector<GapWarning> warnings;
    std::size_t expectedCount{0};
    std::size_t cachedDays{0};
    std::size_t persistedDays{0};
    std::size_t fallbacks{0};
    std::size_t remoteCalls{0};

    bool hasUnexplainedGap() const noexcept;
};

class FailoverOrchestrator {
public:
    FailoverOrchestrator(FcpConfig config,
                         std::shared_ptr<domain::IBarSource> bulk,
                         std::shared_ptr<domain::IBarSource> live);

    FailoverOrchestrator(const FailoverOrchestrator&) = delete;
    FailoverOrchestrator& operator=(const FailoverOrchestrator&) = delete;

    // Bars with open time in [start, end) after boundary adjustment, end
    // clamped to the current time. Either every planned sub-range succeeded
    // or the error names the first one that did not.
    domain::Result<BarSeries> getData(const domain::Symbol& symbol,
                                      const domain::Interval& interval,
                                      domain::TimestampMs start,
                                      domain::TimestampMs end,
                                      const GetDataOptions& options = {});

    const FcpConfig& config() const noexcept { return config_; }
    const std::shared_ptr<FetchCoordinator>& coordinator() const noexcept { return coordinator_; }

private:
    struct CacheScan {
        std::vector<domain::SourcedBar> bars;
        std::set<domain::TimestampMs> days;
        // Leading spans of days whose symbol started trading mid-day.
        std::vector<domain::TimeRange> preListing;
    };

    CacheScan readCache_(const domain::Symbol& symbol,
                         const domain::Interval& interval,
                         const domain::TimeRange& range) const;
    std::size_t persist_(const domain::Symbol& symbol,
                         const domain::Interval& interval,
                         const std::vector<CompletedDay>& days) const;
    domain::CacheKey keyFor_(const domain::Symbol& symbol,
                             const domain::Interval& interval,
                             domain::TimestampMs dayStart) const;

    const FcpConfig config_;
    const domain::MarketCapabilities& market_;
    std::unique_ptr<infra::storage::DailyBarCache> cache_;
    MergeEngine merger_;
    std::shared_ptr<FetchCoordinator> coordinator_;
};

}  // namespace app
