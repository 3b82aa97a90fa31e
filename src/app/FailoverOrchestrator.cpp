#include "app/FailoverOrchestrator.hpp"

#include <algorithm>
#include <utility>

#include "app/DeadlineScope.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/IntervalMath.hpp"

namespace app {
namespace {

using domain::SourceTag;
using domain::TimeRange;
using domain::TimestampMs;

bool within(const TimeRange& inner, const TimeRange& outer) {
    return inner.start >= outer.start && inner.end <= outer.end;
}

domain::FetchError unfinishedError(const DeadlineScope::Outcome& outcome, const PlannedRange& planned) {
    auto error = domain::make_error(outcome.deadlineExceeded ? domain::ErrorKind::DeadlineExceeded
                                                             : domain::ErrorKind::Cancelled,
                                    outcome.deadlineExceeded ? "sub-range did not finish before the deadline"
                                                             : "sub-range was cancelled before it finished");
    error.source = planned.source;
    error.range = planned.range;
    return error;
}

}  // namespace

bool BarSeries::hasUnexplainedGap() const noexcept {
    return std::any_of(warnings.begin(), warnings.end(),
                       [](const GapWarning& gap) { return gap.kind == GapKind::Unexplained; });
}

FailoverOrchestrator::FailoverOrchestrator(FcpConfig config,
                                           std::shared_ptr<domain::IBarSource> bulk,
                                           std::shared_ptr<domain::IBarSource> live)
    : config_(std::move(config)),
      market_(domain::capabilities_for(config_.market)),
      coordinator_(std::make_shared<FetchCoordinator>(config_.coordinator, std::move(bulk), std::move(live))) {
    if (config_.cacheEnabled) {
        infra::storage::DailyBarCache::Options options{};
        options.root = config_.cacheRoot;
        options.maxAge = config_.cacheMaxAge;
        options.now = [this]() { return config_.currentTime(); };
        cache_ = std::make_unique<infra::storage::DailyBarCache>(std::move(options));
    }
}

domain::Result<BarSeries> FailoverOrchestrator::getData(const domain::Symbol& symbol,
                                                        const domain::Interval& interval,
                                                        TimestampMs start,
                                                        TimestampMs end,
                                                        const GetDataOptions& options) {
    using Result = domain::Result<BarSeries>;
    kfcp::log::RequestScope requestScope{kfcp::log::nextRequestId()};
    kfcp::common::metrics::Registry::ScopedTimer timer{"fcp.get_data"};

    if (symbol.empty()) {
        return Result::failure(domain::make_error(domain::ErrorKind::Planning, "symbol is empty"));
    }
    if (!interval.valid() || !market_.supports(interval)) {
        return Result::failure(domain::make_error(domain::ErrorKind::Planning,
                                                  "interval " + domain::interval_label(interval) +
                                                      " is not supported on " + domain::to_string(config_.market)));
    }
    if (start >= end) {
        return Result::failure(domain::make_error(domain::ErrorKind::Planning, "start must be before end"));
    }
    if (options.enforceSource == SourceTag::Cache && !cache_) {
        return Result::failure(domain::make_error(domain::ErrorKind::Planning, "cache-only request with cache disabled"));
    }
    if (options.cancel && options.cancel->cancelled()) {
        return Result::failure(domain::make_error(domain::ErrorKind::Cancelled, options.cancel->reason()));
    }

    const TimestampMs now = config_.currentTime();
    const auto range = domain::adjust_request_window(start, std::min(end, now), interval);
    if (range.empty()) {
        auto error = domain::make_error(domain::ErrorKind::Planning, "no closed bar in the requested window");
        error.range = TimeRange{start, end};
        return Result::failure(std::move(error));
    }

    BarSeries series{};
    series.symbol = symbol;
    series.interval = interval;
    series.range = range;

    const bool useCache = cache_ && options.enforceSource != SourceTag::BulkHistorical &&
                          options.enforceSource != SourceTag::Live;
    auto scan = useCache ? readCache_(symbol, interval, range) : CacheScan{};
    series.cachedDays = scan.days.size();

    PlannerConfig plannerConfig = config_.planner;
    if (options.freshnessDelay) {
        plannerConfig.freshnessDelay = *options.freshnessDelay;
    }
    const RangePlanner planner{plannerConfig};
    auto planned = planner.plan(range, interval, market_, scan.days, now, options.enforceSource);
    if (planned.failed()) {
        planned.error.range = range;
        return Result::failure(std::move(planned.error));
    }
    const auto& plan = planned.value;

    std::vector<domain::SourcedBar> collected = std::move(scan.bars);
    std::vector<TimeRange> blocked;
    std::optional<domain::FetchError> failure;

    if (!plan.fetches.empty()) {
        FetchContext context{};
        context.provider = config_.provider;
        context.market = config_.market;
        context.symbol = symbol;
        context.interval = interval;
        context.allowFallback = !options.enforceSource;

        DeadlineScope scope{config_.deadline, options.cancel};
        auto batch = coordinator_->dispatch(context, plan.fetches, scope);
        const auto outcome = scope.wait();
        auto results = batch->outcomes();

        for (std::size_t i = 0; i < results.size(); ++i) {
            auto& slot = results[i];
            if (!slot) {
                blocked.push_back(batch->range(i).range);
                if (!failure || failure->kind == domain::ErrorKind::Source) {
                    failure = unfinishedError(outcome, batch->range(i));
                }
                continue;
            }
            series.remoteCalls += slot->calls;
            series.fallbacks += slot->fellBack ? 1U : 0U;
            collected.insert(collected.end(), slot->bars.begin(), slot->bars.end());
            if (!slot->ok) {
                blocked.push_back(slot->planned.range);
                if (!failure) {
                    failure = slot->error;
                }
            }
        }
        if (failure && outcome.deadlineExceeded) {
            failure->kind = domain::ErrorKind::DeadlineExceeded;
        }
    }

    auto merged = merger_.merge(std::move(collected), range, interval);

    // Completed days are written even when another sub-range failed.
    if (cache_ && !options.enforceSource) {
        series.persistedDays = persist_(symbol, interval, merger_.completedDays(merged, range, interval, now, blocked));
    }

    if (failure) {
        LOG_ERR("GetData " << symbol << ' ' << domain::interval_label(interval) << " failed: " << failure->describe());
        return Result::failure(std::move(*failure));
    }

    for (auto& gap : merged.gaps) {
        const bool preListing = std::any_of(scan.preListing.begin(), scan.preListing.end(),
                                            [&](const TimeRange& span) { return within(gap.range, span); });
        if (preListing) {
            continue;
        }
        if (gap.kind == GapKind::Unexplained) {
            LOG_WARN("Unexplained gap in " << symbol << ' ' << domain::interval_label(interval) << ": "
                                           << gap.missingBars << " bar(s) from "
                                           << domain::format_timestamp(gap.range.start) << " to "
                                           << domain::format_timestamp(gap.range.end));
        } else {
            LOG_DEBUG("Boundary tick missing at " << domain::format_timestamp(gap.range.start));
        }
        series.warnings.push_back(gap);
    }

    series.expectedCount = merged.expectedCount;
    series.bars.reserve(merged.bars.size());
    if (options.includeSources) {
        series.sources.reserve(merged.bars.size());
    }
    for (const auto& sourced : merged.bars) {
        series.bars.push_back(sourced.bar);
        if (options.includeSources) {
            series.sources.push_back(sourced.source);
        }
    }

    LOG_INFO("GetData " << symbol << ' ' << domain::interval_label(interval) << " ["
                        << domain::format_timestamp(range.start) << ", " << domain::format_timestamp(range.end)
                        << ") bars=" << series.bars.size() << '/' << series.expectedCount
                        << " cachedDays=" << series.cachedDays << " fetches=" << plan.fetches.size()
                        << " calls=" << series.remoteCalls << " persisted=" << series.persistedDays);
    return Result::success(std::move(series));
}

FailoverOrchestrator::CacheScan FailoverOrchestrator::readCache_(const domain::Symbol& symbol,
                                                                 const domain::Interval& interval,
                                                                 const TimeRange& range) const {
    CacheScan scan;
    if (!domain::divides_day(interval)) {
        return scan;
    }
    for (auto day = domain::day_start(range.start); day < range.end; day += domain::kMillisPerDay) {
        auto lookup = cache_->read(keyFor_(symbol, interval, day));
        if (!lookup.ok()) {
            continue;
        }
        scan.days.insert(day);
        if (lookup.truncatedStart && !lookup.bars.empty()) {
            scan.preListing.push_back(TimeRange{day, lookup.bars.front().openTime});
        }
        for (const auto& bar : lookup.bars) {
            if (range.contains(bar.openTime)) {
                scan.bars.push_back(domain::SourcedBar{bar, SourceTag::Cache});
            }
        }
    }
    return scan;
}

std::size_t FailoverOrchestrator::persist_(const domain::Symbol& symbol,
                                           const domain::Interval& interval,
                                           const std::vector<CompletedDay>& days) const {
    std::size_t written = 0;
    for (const auto& day : days) {
        const auto key = keyFor_(symbol, interval, day.dayStart);
        auto result = cache_->write(key, day.bars, day.truncatedStart);
        if (result.failed()) {
            LOG_WARN("Could not cache " << key.id() << ": " << result.error.describe());
            continue;
        }
        ++written;
    }
    return written;
}

domain::CacheKey FailoverOrchestrator::keyFor_(const domain::Symbol& symbol,
                                               const domain::Interval& interval,
                                               TimestampMs dayStart) const {
    domain::CacheKey key{};
    key.provider = config_.provider;
    key.market = config_.market;
    key.symbol = symbol;
    key.interval = interval;
    key.dayStart = dayStart;
    return key;
}

}  // namespace app
