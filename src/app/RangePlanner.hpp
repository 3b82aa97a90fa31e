#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <vector>

#include "domain/DomainContracts.h"
#include "domain/MarketCapabilities.hpp"
#include "domain/Types.h"

namespace app {

struct PlannedRange {
    domain::TimeRange range;
    domain::SourceTag source{domain::SourceTag::Live};
};

struct FetchPlan {
    std::vector<PlannedRange> fetches;
    std::vector<domain::TimeRange> cached;
};

struct PlannerConfig {
    // Bulk archives lag live trading by this much.
    std::chrono::milliseconds freshnessDelay{std::chrono::hours(48)};
    // Old gaps of at most this many bars go to LIVE; zero disables.
    std::size_t liveOnlyMaxBars{0};
};

class RangePlanner {
public:
    explicit RangePlanner(PlannerConfig config = {});

    // `range` must already be boundary adjusted. `cachedDays` holds the UTC
    // midnights of days that passed integrity checks.
    domain::Result<FetchPlan> plan(const domain::TimeRange& range,
                                   const domain::Interval& interval,
                                   const domain::MarketCapabilities& market,
                                   const std::set<domain::TimestampMs>& cachedDays,
                                   domain::TimestampMs now,
                                   std::optional<domain::SourceTag> forcedSource = std::nullopt) const;

    const PlannerConfig& config() const noexcept { return config_; }

private:
    void classifyGap_(const domain::TimeRange& gap,
                      const domain::Interval& interval,
                      const domain::MarketCapabilities& market,
                      domain::TimestampMs now,
                      std::vector<PlannedRange>& out) const;

    PlannerConfig config_;
};

}  // namespace app
