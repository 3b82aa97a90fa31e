#include <chrono>
#include <iostream>
#include <set>
#include <string>

#include "app/RangePlanner.hpp"
#include "domain/IntervalMath.hpp"
#include "domain/MarketCapabilities.hpp"

namespace {

using domain::SourceTag;
using domain::TimeRange;
using domain::TimestampMs;

bool samePlanned(const app::PlannedRange& planned, TimestampMs start, TimestampMs end, SourceTag source) {
    return planned.range.start == start && planned.range.end == end && planned.source == source;
}

}  // namespace

int main() {
    using domain::kMillisPerDay;
    using domain::utc_timestamp;

    const auto& spot = domain::capabilities_for(domain::MarketType::Spot);
    const auto& futures = domain::capabilities_for(domain::MarketType::FuturesUsdt);
    const auto oneMinute = domain::interval_from_label("1m");
    const auto oneHour = domain::interval_from_label("1h");
    const auto day1 = utc_timestamp(2024, 3, 1);
    const auto now = utc_timestamp(2024, 3, 10, 12, 0, 0);

    {
        // Days 1-2 cached, day 3 old enough for bulk, the rest inside the
        // freshness window goes to live.
        app::RangePlanner planner{};
        const TimeRange range{day1, now};
        const std::set<TimestampMs> cached{day1, day1 + kMillisPerDay};
        const auto result = planner.plan(range, oneMinute, spot, cached, now);
        if (result.failed()) {
            std::cerr << "Plan failed: " << result.error.describe() << "\n";
            return 1;
        }
        const auto& plan = result.value;
        if (plan.cached.size() != 1 || plan.cached[0].start != day1 || plan.cached[0].end != day1 + 2 * kMillisPerDay) {
            std::cerr << "Adjacent cached days should merge into one span\n";
            return 1;
        }
        const auto boundary = now - 48 * domain::kMillisPerHour;
        if (plan.fetches.size() != 2 ||
            !samePlanned(plan.fetches[0], day1 + 2 * kMillisPerDay, boundary, SourceTag::BulkHistorical) ||
            !samePlanned(plan.fetches[1], boundary, now, SourceTag::Live)) {
            std::cerr << "Expected one bulk span up to the freshness boundary and one live span after it\n";
            return 1;
        }
    }

    {
        // A cached day in the middle splits the uncached remainder.
        app::RangePlanner planner{};
        const TimeRange range{day1, day1 + 3 * kMillisPerDay};
        const std::set<TimestampMs> cached{day1 + kMillisPerDay};
        const auto result = planner.plan(range, oneHour, spot, cached, now);
        if (result.failed() || result.value.fetches.size() != 2 ||
            !samePlanned(result.value.fetches[0], day1, day1 + kMillisPerDay, SourceTag::BulkHistorical) ||
            !samePlanned(result.value.fetches[1], day1 + 2 * kMillisPerDay, day1 + 3 * kMillisPerDay,
                         SourceTag::BulkHistorical)) {
            std::cerr << "Cached day should split the bulk fetches\n";
            return 1;
        }
    }

    {
        // Weekly bars have no daily archive and are never cached.
        app::RangePlanner planner{};
        const auto oneWeek = domain::interval_from_label("1w");
        const TimeRange range{utc_timestamp(2024, 1, 1), utc_timestamp(2024, 3, 4)};
        const auto result = planner.plan(range, oneWeek, spot, {range.start}, now);
        if (result.failed() || !result.value.cached.empty() || result.value.fetches.size() != 1 ||
            !samePlanned(result.value.fetches[0], range.start, range.end, SourceTag::Live)) {
            std::cerr << "Weekly range should be fetched from live only\n";
            return 1;
        }
    }

    {
        app::PlannerConfig config{};
        config.liveOnlyMaxBars = 120;
        app::RangePlanner planner{config};
        const TimeRange smallGap{day1, day1 + 60 * domain::kMillisPerMinute};
        const auto result = planner.plan(smallGap, oneMinute, spot, {}, now);
        if (result.failed() || result.value.fetches.size() != 1 || result.value.fetches[0].source != SourceTag::Live) {
            std::cerr << "Small old gap should go to live\n";
            return 1;
        }
    }

    {
        app::PlannerConfig config{};
        config.freshnessDelay = std::chrono::hours(0);
        app::RangePlanner planner{config};
        const TimeRange range{day1, now};
        const auto result = planner.plan(range, oneHour, spot, {}, now);
        if (result.failed() || result.value.fetches.size() != 1 ||
            result.value.fetches[0].source != SourceTag::BulkHistorical) {
            std::cerr << "Zero freshness delay should plan bulk for the whole closed range\n";
            return 1;
        }
    }

    {
        app::RangePlanner planner{};
        const TimeRange range{day1, day1 + 2 * kMillisPerDay};
        const std::set<TimestampMs> cached{day1};

        const auto cacheOnly = planner.plan(range, oneMinute, spot, cached, now, SourceTag::Cache);
        if (cacheOnly.failed() || !cacheOnly.value.fetches.empty() || cacheOnly.value.cached.size() != 1) {
            std::cerr << "Cache-only plan must not fetch\n";
            return 1;
        }

        const auto liveOnly = planner.plan(range, oneMinute, spot, cached, now, SourceTag::Live);
        if (liveOnly.failed() || !liveOnly.value.cached.empty() || liveOnly.value.fetches.size() != 1 ||
            !samePlanned(liveOnly.value.fetches[0], range.start, range.end, SourceTag::Live)) {
            std::cerr << "Live-only plan must ignore the cache and cover the whole range\n";
            return 1;
        }

        const auto bulkWeekly = planner.plan(TimeRange{utc_timestamp(2024, 1, 1), utc_timestamp(2024, 3, 4)},
                                             domain::interval_from_label("1w"), spot, {}, now,
                                             SourceTag::BulkHistorical);
        if (!bulkWeekly.failed() || bulkWeekly.error.kind != domain::ErrorKind::Planning) {
            std::cerr << "Forcing bulk for an interval without archives must be a planning error\n";
            return 1;
        }
    }

    {
        app::RangePlanner planner{};
        const auto oneSecond = domain::interval_from_label("1s");
        const TimeRange range{day1, day1 + domain::kMillisPerMinute};
        if (!planner.plan(range, oneSecond, futures, {}, now).failed()) {
            std::cerr << "Futures markets have no 1s bars\n";
            return 1;
        }
        if (planner.plan(range, oneSecond, spot, {}, now).failed()) {
            std::cerr << "Spot supports 1s bars\n";
            return 1;
        }
        if (!planner.plan(TimeRange{day1, day1}, oneMinute, spot, {}, now).failed()) {
            std::cerr << "Empty range must be rejected\n";
            return 1;
        }
        const auto misaligned = planner.plan(TimeRange{day1 + 1, day1 + kMillisPerDay}, oneMinute, spot, {}, now);
        if (!misaligned.failed() || misaligned.error.kind != domain::ErrorKind::Planning) {
            std::cerr << "Misaligned range must be a planning error\n";
            return 1;
        }
    }

    return 0;
}
