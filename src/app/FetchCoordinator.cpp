#include "app/FetchCoordinator.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "app/MergeEngine.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/IntervalMath.hpp"

namespace app {
namespace {

namespace metrics = kfcp::common::metrics;

using domain::SourceTag;
using domain::TimeRange;

using Clock = std::chrono::steady_clock;

std::size_t slotFor(SourceTag tag) { return static_cast<std::size_t>(domain::priority_rank(tag)); }

std::string describeRange(const TimeRange& range) {
    std::ostringstream oss;
    oss << '[' << domain::format_timestamp(range.start) << ", " << domain::format_timestamp(range.end) << ')';
    return oss.str();
}

std::string counterFor(const char* prefix, SourceTag tag) {
    std::string key{prefix};
    switch (tag) {
    case SourceTag::Cache:
        key += "cache";
        break;
    case SourceTag::BulkHistorical:
        key += "bulk";
        break;
    case SourceTag::Live:
        key += "live";
        break;
    }
    return key;
}

domain::FetchError cancelledError(const core::CancellationToken& cancel, const TimeRange& range, SourceTag tag) {
    const auto reason = cancel.reason();
    auto error = domain::make_error(
        reason.find("deadline") != std::string::npos ? domain::ErrorKind::DeadlineExceeded : domain::ErrorKind::Cancelled,
        reason.empty() ? std::string{"cancelled"} : reason);
    error.source = tag;
    error.range = range;
    return error;
}

bool isCancellation(const domain::FetchError& error) {
    return error.kind == domain::ErrorKind::Cancelled || error.kind == domain::ErrorKind::DeadlineExceeded;
}

}  // namespace

struct FetchCoordinator::InFlight {
    TimeRange range;
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    BarsResult result;
};

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const {
    const int exponent = std::clamp(attempt - 1, 0, 30);
    auto delay = baseBackoff.count() * (1LL << exponent);
    delay = std::min<long long>(delay, maxBackoff.count());
    if (maxJitter.count() > 0) {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<long long> jitter(0, maxJitter.count());
        delay += jitter(rng);
    }
    return std::chrono::milliseconds(delay);
}

std::string FetchContext::key() const {
    std::string out = domain::to_string(provider);
    out += '|';
    out += domain::to_string(market);
    out += '|';
    out += symbol;
    out += '|';
    out += domain::interval_label(interval);
    if (!allowFallback) {
        out += "|strict";
    }
    return out;
}

FetchBatch::FetchBatch(std::vector<PlannedRange> ranges)
    : ranges_(std::move(ranges)), outcomes_(ranges_.size()) {}

std::optional<std::size_t> FetchBatch::claim() {
    const auto index = next_.fetch_add(1, std::memory_order_relaxed);
    if (index >= ranges_.size()) {
        return std::nullopt;
    }
    return index;
}

void FetchBatch::store(std::size_t index, SubRangeOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.at(index) = std::move(outcome);
}

std::vector<std::optional<SubRangeOutcome>> FetchBatch::outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

void FetchCoordinator::RateGate::defer(SourceTag source, Clock::time_point until) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = until_[slotFor(source)];
    slot = std::max(slot, until);
}

bool FetchCoordinator::RateGate::wait(SourceTag source, core::CancellationToken& cancel) {
    Clock::time_point until;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        until = until_[slotFor(source)];
    }
    if (until > Clock::now()) {
        return cancel.sleep_until(until);
    }
    return !cancel.cancelled();
}

FetchCoordinator::FetchCoordinator(CoordinatorConfig config,
                                   std::shared_ptr<domain::IBarSource> bulk,
                                   std::shared_ptr<domain::IBarSource> live)
    : config_(config), bulk_(std::move(bulk)), live_(std::move(live)) {
    if (!live_) {
        throw std::invalid_argument("FetchCoordinator requires a live source");
    }
}

std::shared_ptr<FetchBatch> FetchCoordinator::dispatch(const FetchContext& context,
                                                       std::vector<PlannedRange> ranges,
                                                       DeadlineScope& scope) {
    auto batch = std::make_shared<FetchBatch>(std::move(ranges));
    const auto workers = std::min(std::max<std::size_t>(config_.maxWorkers, 1), batch->size());
    auto self = shared_from_this();

    for (std::size_t i = 0; i < workers; ++i) {
        scope.spawn([self, batch, context](core::CancellationToken& cancel) {
            while (auto index = batch->claim()) {
                if (cancel.cancelled()) {
                    break;
                }
                batch->store(*index, self->fetchSubRange(context, batch->range(*index), cancel));
            }
        });
    }
    LOG_DEBUG("Dispatched " << batch->size() << " sub-range(s) on " << workers << " worker(s) for "
                            << context.key());
    return batch;
}

SubRangeOutcome FetchCoordinator::fetchSubRange(const FetchContext& context,
                                                const PlannedRange& planned,
                                                core::CancellationToken& cancel) {
    SubRangeOutcome outcome;
    outcome.planned = planned;

    const auto absorb = [&outcome](ChunkRun&& run) {
        outcome.calls += run.calls;
        outcome.shared = outcome.shared || run.shared;
        outcome.bars.insert(outcome.bars.end(), run.bars.begin(), run.bars.end());
        outcome.ok = run.ok;
        outcome.error = std::move(run.error);
    };

    switch (planned.source) {
    case SourceTag::Cache:
        outcome.error = domain::make_error(domain::ErrorKind::Planning, "cache spans are never fetched");
        outcome.error.range = planned.range;
        return outcome;

    case SourceTag::Live:
        absorb(fetchChunks_(*live_, context, planned.range, cancel, false));
        return outcome;

    case SourceTag::BulkHistorical: {
        TimeRange fallbackRange = planned.range;
        std::string cause;
        if (bulk_ && bulk_->supports(context.interval)) {
            auto run = fetchChunks_(*bulk_, context, planned.range, cancel,
                                    config_.fillBulkGapsFromLive && context.allowFallback);
            if (run.ok || run.terminal || isCancellation(run.error) || !context.allowFallback) {
                absorb(std::move(run));
                return outcome;
            }
            fallbackRange.start = run.failedFrom;
            cause = run.error.describe();
            run.ok = true;
            absorb(std::move(run));
        } else {
            cause = "bulk source unavailable for " + domain::interval_label(context.interval);
            if (!context.allowFallback) {
                outcome.error = domain::source_error(domain::SourceErrorClass::InvalidRequest, cause);
                outcome.error.source = SourceTag::BulkHistorical;
                outcome.error.range = planned.range;
                return outcome;
            }
        }

        metrics::increment("fetch.fallbacks");
        LOG_WARN("Falling back to LIVE for " << context.symbol << ' ' << describeRange(fallbackRange) << " after "
                                             << cause);
        outcome.fellBack = true;
        absorb(fetchChunks_(*live_, context, fallbackRange, cancel, false));
        return outcome;
    }
    }

    outcome.error = domain::make_error(domain::ErrorKind::Planning, "unknown source tag");
    return outcome;
}

FetchCoordinator::ChunkRun FetchCoordinator::fetchChunks_(domain::IBarSource& source,
                                                          const FetchContext& context,
                                                          const TimeRange& range,
                                                          core::CancellationToken& cancel,
                                                          bool fillGaps) {
    ChunkRun run;
    run.failedFrom = range.start;
    const auto tag = source.tag();
    const auto maxRows = std::max<std::size_t>(source.max_rows_per_call(context.interval), 1);

    // Bulk archives are published per UTC day, so bulk chunks never cross midnight.
    const bool dailyChunks = tag == SourceTag::BulkHistorical && domain::divides_day(context.interval);

    // Chunks of one sub-range go strictly in order.
    auto cursor = range.start;
    while (cursor < range.end) {
        auto chunkEnd = std::min(range.end, domain::advance_open_time(cursor, context.interval, maxRows));
        if (dailyChunks) {
            chunkEnd = std::min(chunkEnd, domain::day_start(cursor) + domain::kMillisPerDay);
        }
        const TimeRange chunk{cursor, chunkEnd};

        auto result = callShared_(source, context, chunk, cancel, run.calls, run.shared);
        if (result.failed()) {
            run.error = std::move(result.error);
            run.failedFrom = cursor;
            run.terminal = tag == SourceTag::Live;
            return run;
        }

        std::vector<domain::SourcedBar> chunkBars;
        chunkBars.reserve(result.value.size());
        for (const auto& bar : result.value) {
            if (chunk.contains(bar.openTime)) {
                chunkBars.push_back(domain::SourcedBar{bar, tag});
            }
        }

        if (fillGaps && tag != SourceTag::Live) {
            std::sort(chunkBars.begin(), chunkBars.end(), [](const auto& lhs, const auto& rhs) {
                return lhs.bar.openTime < rhs.bar.openTime;
            });
            const auto gaps = MergeEngine::detectGaps(chunkBars, chunk, context.interval);
            if (gaps.size() == 1 && gaps.front().range == chunk) {
                // Nothing at all for this chunk: handled as a failure so the
                // whole remainder falls back.
                run.error = domain::source_error(domain::SourceErrorClass::NotFound, "no bars in bulk archive");
                run.error.source = tag;
                run.error.range = chunk;
                run.failedFrom = cursor;
                return run;
            }
            for (const auto& gap : gaps) {
                LOG_INFO("Filling " << gap.missingBars << " bar(s) missing from bulk data at "
                                    << describeRange(gap.range) << " from LIVE");
                auto fill = fetchChunks_(*live_, context, gap.range, cancel, false);
                run.calls += fill.calls;
                run.shared = run.shared || fill.shared;
                chunkBars.insert(chunkBars.end(), fill.bars.begin(), fill.bars.end());
                if (!fill.ok) {
                    run.bars.insert(run.bars.end(), chunkBars.begin(), chunkBars.end());
                    run.error = std::move(fill.error);
                    run.failedFrom = cursor;
                    run.terminal = true;
                    return run;
                }
            }
        }

        run.bars.insert(run.bars.end(), chunkBars.begin(), chunkBars.end());
        cursor = chunk.end;
    }

    run.ok = true;
    return run;
}

FetchCoordinator::BarsResult FetchCoordinator::callShared_(domain::IBarSource& source,
                                                         const FetchContext& context,
                                                         const TimeRange& chunk,
                                                         core::CancellationToken& cancel,
                                                         std::size_t& calls,
                                                         bool& shared) {
    struct Piece {
        TimeRange range;
        std::shared_ptr<InFlight> entry;
        bool lead{false};
    };

    const auto tag = source.tag();
    const auto group = context.key() + '|' + domain::to_string(tag);
    std::vector<Piece> pieces;
    std::vector<std::shared_ptr<InFlight>> leads;
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        auto& entries = inflight_[group];
        std::vector<std::shared_ptr<InFlight>> overlapping;
        for (const auto& entry : entries) {
            if (entry->range.start < chunk.end && chunk.start < entry->range.end) {
                overlapping.push_back(entry);
            }
        }
        std::sort(overlapping.begin(), overlapping.end(),
                  [](const auto& lhs, const auto& rhs) { return lhs->range.start < rhs->range.start; });

        const auto lead = [&](domain::TimestampMs from, domain::TimestampMs to) {
            auto entry = std::make_shared<InFlight>();
            entry->range = TimeRange{from, to};
            entries.push_back(entry);
            leads.push_back(entry);
            pieces.push_back(Piece{entry->range, entry, true});
        };
        auto cursor = chunk.start;
        for (const auto& entry : overlapping) {
            if (entry->range.start > cursor) {
                lead(cursor, entry->range.start);
            }
            const TimeRange joined{std::max(cursor, entry->range.start), std::min(chunk.end, entry->range.end)};
            pieces.push_back(Piece{joined, entry, false});
            cursor = joined.end;
        }
        if (cursor < chunk.end) {
            lead(cursor, chunk.end);
        }
    }

    // Spans this caller registered are always published: with the result,
    // with a cancellation error when it stops early or throws, or when its
    // token is force released while the remote call is still stuck.
    struct LeadGuard {
        FetchCoordinator& self;
        const std::string& group;
        const std::vector<std::shared_ptr<InFlight>>& leads;

        ~LeadGuard() {
            for (const auto& entry : leads) {
                self.publish_(group, entry,
                              BarsResult::failure(domain::make_error(domain::ErrorKind::Cancelled,
                                                                     "in-flight fetch stopped")));
            }
        }
    } guard{*this, group, leads};

    core::CancellationToken::Registration abandon(cancel, {}, [this, group, leads]() {
        for (const auto& entry : leads) {
            publish_(group, entry,
                     BarsResult::failure(domain::make_error(domain::ErrorKind::DeadlineExceeded,
                                                            "in-flight fetch was force released")));
        }
    });

    std::vector<domain::Bar> bars;
    // Own spans first so nobody waits on this caller while it waits on others.
    for (const auto& piece : pieces) {
        if (!piece.lead) {
            continue;
        }
        auto result = callWithRetry_(source, context, piece.range, cancel, calls);
        publish_(group, piece.entry, result);
        if (result.failed()) {
            return result;
        }
        bars.insert(bars.end(), result.value.begin(), result.value.end());
    }

    for (const auto& piece : pieces) {
        if (piece.lead) {
            continue;
        }
        shared = true;
        auto result = join_(piece.entry, tag, cancel);
        if (result.failed() && isCancellation(result.error) && !cancel.cancelled()) {
            LOG_DEBUG("In-flight fetch of " << describeRange(piece.range) << " stopped, fetching it here");
            result = callShared_(source, context, piece.range, cancel, calls, shared);
        }
        if (result.failed()) {
            if (cancel.cancelled()) {
                return BarsResult::failure(cancelledError(cancel, piece.range, tag));
            }
            return result;
        }
        for (const auto& bar : result.value) {
            if (piece.range.contains(bar.openTime)) {
                bars.push_back(bar);
            }
        }
    }

    std::sort(bars.begin(), bars.end(),
              [](const domain::Bar& lhs, const domain::Bar& rhs) { return lhs.openTime < rhs.openTime; });
    return BarsResult::success(std::move(bars));
}

FetchCoordinator::BarsResult FetchCoordinator::join_(const std::shared_ptr<InFlight>& entry,
                                                     SourceTag tag,
                                                     core::CancellationToken& cancel) {
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        ++waitingFollowers_;
    }
    metrics::increment("fetch.deduplicated");

    std::optional<BarsResult> result;
    {
        core::CancellationToken::Registration wake(cancel, [entry]() {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->cv.notify_all();
        });
        std::unique_lock<std::mutex> lock(entry->mutex);
        entry->cv.wait(lock, [&]() { return entry->done || cancel.cancelled(); });
        if (entry->done) {
            result = entry->result;
        }
    }
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        --waitingFollowers_;
    }

    if (!result) {
        return BarsResult::failure(cancelledError(cancel, entry->range, tag));
    }
    return *result;
}

void FetchCoordinator::publish_(const std::string& group,
                                const std::shared_ptr<InFlight>& entry,
                                const BarsResult& result) {
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        auto it = inflight_.find(group);
        if (it != inflight_.end()) {
            auto& entries = it->second;
            entries.erase(std::remove(entries.begin(), entries.end(), entry), entries.end());
            if (entries.empty()) {
                inflight_.erase(it);
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->done) {
            return;
        }
        entry->result = result;
        entry->done = true;
    }
    entry->cv.notify_all();
}

std::size_t FetchCoordinator::inFlight() const {
    std::lock_guard<std::mutex> lock(inflightMutex_);
    std::size_t count = 0;
    for (const auto& group : inflight_) {
        count += group.second.size();
    }
    return count;
}

std::size_t FetchCoordinator::waitingFollowers() const {
    std::lock_guard<std::mutex> lock(inflightMutex_);
    return waitingFollowers_;
}

FetchCoordinator::BarsResult FetchCoordinator::callWithRetry_(domain::IBarSource& source,
                                                              const FetchContext& context,
                                                              const TimeRange& chunk,
                                                              core::CancellationToken& cancel,
                                                              std::size_t& calls) {
    using Result = BarsResult;
    const auto tag = source.tag();
    RetryState state;

    for (state.attempt = 1;; ++state.attempt) {
        if (!rateGate_.wait(tag, cancel)) {
            return Result::failure(cancelledError(cancel, chunk, tag));
        }

        ++calls;
        metrics::increment(counterFor("fetch.calls.", tag));

        Result result;
        try {
            result = source.fetch_bars(context.symbol, context.interval, chunk, cancel);
        } catch (const std::exception& ex) {
            result = Result::failure(domain::source_error(domain::SourceErrorClass::Permanent, ex.what()));
        }
        if (result.ok) {
            return result;
        }

        auto& error = result.error;
        error.source = tag;
        error.range = chunk;
        if (cancel.cancelled() || isCancellation(error)) {
            return Result::failure(cancelledError(cancel, chunk, tag));
        }

        state.lastError = error.sourceClass;
        if (!error.transient()) {
            return result;
        }
        if (state.attempt >= config_.retry.maxAttempts) {
            error.message += " (gave up after " + std::to_string(state.attempt) + " attempts)";
            return result;
        }

        auto delay = config_.retry.backoffFor(state.attempt);
        const auto now = Clock::now();
        if (error.retryAfter) {
            delay = std::max(delay, *error.retryAfter);
            rateGate_.defer(tag, now + *error.retryAfter);
        }
        state.nextAllowed = now + delay;

        metrics::increment(counterFor("fetch.retries.", tag));
        LOG_WARN("Retrying " << domain::to_string(tag) << ' ' << context.symbol << ' ' << describeRange(chunk)
                             << " in " << delay.count() << " ms after " << domain::to_string(state.lastError)
                             << " (attempt " << state.attempt << '/' << config_.retry.maxAttempts
                             << "): " << error.message);
        if (!cancel.sleep_until(state.nextAllowed)) {
            return Result::failure(cancelledError(cancel, chunk, tag));
        }
    }
}

}  // namespace app
