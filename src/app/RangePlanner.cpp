#include "app/RangePlanner.hpp"

#include <algorithm>

#include "common/Log.hpp"
#include "domain/IntervalMath.hpp"

namespace app {
namespace {

using domain::SourceTag;
using domain::TimeRange;
using domain::TimestampMs;

void appendMerged(std::vector<TimeRange>& ranges, const TimeRange& piece) {
    if (!ranges.empty() && ranges.back().end == piece.start) {
        ranges.back().end = piece.end;
        return;
    }
    ranges.push_back(piece);
}

void appendPlanned(std::vector<PlannedRange>& out, const TimeRange& range, SourceTag source) {
    if (range.empty()) {
        return;
    }
    if (!out.empty() && out.back().source == source && out.back().range.end == range.start) {
        out.back().range.end = range.end;
        return;
    }
    out.push_back(PlannedRange{range, source});
}

}  // namespace

RangePlanner::RangePlanner(PlannerConfig config) : config_(config) {}

domain::Result<FetchPlan> RangePlanner::plan(const TimeRange& range,
                                             const domain::Interval& interval,
                                             const domain::MarketCapabilities& market,
                                             const std::set<TimestampMs>& cachedDays,
                                             TimestampMs now,
                                             std::optional<SourceTag> forcedSource) const {
    using Result = domain::Result<FetchPlan>;

    if (!interval.valid() || !market.supports(interval)) {
        return Result::failure(domain::make_error(
            domain::ErrorKind::Planning,
            "interval " + domain::interval_label(interval) + " is not supported on " + domain::to_string(market.market)));
    }
    if (range.empty()) {
        return Result::failure(domain::make_error(domain::ErrorKind::Planning, "requested range is empty"));
    }
    if (!domain::is_aligned(range.start, interval) || !domain::is_aligned(range.end, interval)) {
        return Result::failure(
            domain::make_error(domain::ErrorKind::Planning, "requested range is not aligned to the interval"));
    }
    if (forcedSource == SourceTag::BulkHistorical && !market.bulkSupports(interval)) {
        return Result::failure(domain::make_error(
            domain::ErrorKind::Planning,
            "bulk source has no " + domain::interval_label(interval) + " files for " + domain::to_string(market.market)));
    }

    const bool useCache = forcedSource != SourceTag::BulkHistorical && forcedSource != SourceTag::Live;
    FetchPlan plan;
    std::vector<TimeRange> gaps;

    if (domain::divides_day(interval)) {
        for (auto day = domain::day_start(range.start); day < range.end; day += domain::kMillisPerDay) {
            const TimeRange piece{std::max(day, range.start), std::min(day + domain::kMillisPerDay, range.end)};
            if (useCache && cachedDays.count(day) != 0U) {
                appendMerged(plan.cached, piece);
            } else {
                appendMerged(gaps, piece);
            }
        }
    } else {
        gaps.push_back(range);
    }

    if (forcedSource == SourceTag::Cache) {
        if (!gaps.empty()) {
            LOG_INFO("Cache-only request leaves " << gaps.size() << " span(s) unfilled");
        }
        return Result::success(std::move(plan));
    }

    for (const auto& gap : gaps) {
        if (forcedSource) {
            appendPlanned(plan.fetches, gap, *forcedSource);
        } else {
            classifyGap_(gap, interval, market, now, plan.fetches);
        }
    }

    LOG_DEBUG("Planned " << plan.fetches.size() << " fetch(es), " << plan.cached.size() << " cached span(s)");
    return Result::success(std::move(plan));
}

void RangePlanner::classifyGap_(const TimeRange& gap,
                                const domain::Interval& interval,
                                const domain::MarketCapabilities& market,
                                TimestampMs now,
                                std::vector<PlannedRange>& out) const {
    if (!market.bulkSupports(interval)) {
        appendPlanned(out, gap, SourceTag::Live);
        return;
    }

    const auto smallEnoughForLive = [&](const TimeRange& span) {
        return config_.liveOnlyMaxBars > 0 && domain::expected_count(span, interval) <= config_.liveOnlyMaxBars;
    };

    // Bars opening before the boundary are assumed to be in the bulk archive.
    const TimestampMs boundary = domain::floor_to_interval(now - config_.freshnessDelay.count(), interval);

    if (gap.end <= boundary) {
        appendPlanned(out, gap, smallEnoughForLive(gap) ? SourceTag::Live : SourceTag::BulkHistorical);
        return;
    }
    if (gap.start >= boundary) {
        appendPlanned(out, gap, SourceTag::Live);
        return;
    }

    const TimeRange older{gap.start, boundary};
    const TimeRange newer{boundary, gap.end};
    appendPlanned(out, older, smallEnoughForLive(older) ? SourceTag::Live : SourceTag::BulkHistorical);
    appendPlanned(out, newer, SourceTag::Live);
}

}  // namespace app
