#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/DeadlineScope.hpp"
#include "app/RangePlanner.hpp"
#include "core/CancellationToken.hpp"
#include "domain/DomainContracts.h"
#include "domain/Types.h"
#include "domain/exchange/IBarSource.hpp"

namespace app {

struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds baseBackoff{1000};
    std::chrono::milliseconds maxBackoff{120000};
    std::chrono::milliseconds maxJitter{1000};

    // Exponential delay for the given 1-based attempt, capped, plus jitter.
    std::chrono::milliseconds backoffFor(int attempt) const;
};

struct RetryState {
    int attempt{0};
    domain::SourceErrorClass lastError{domain::SourceErrorClass::None};
    std::chrono::steady_clock::time_point nextAllowed{};
};

struct CoordinatorConfig {
    std::size_t maxWorkers{8};
    RetryPolicy retry{};
    // Bars missing from a successful bulk chunk are requested from LIVE.
    bool fillBulkGapsFromLive{true};
};

struct FetchContext {
    domain::DataProvider provider{domain::DataProvider::Binance};
    domain::MarketType market{domain::MarketType::Spot};
    domain::Symbol symbol;
    domain::Interval interval{};
    // False pins every sub-range to its planned source: no LIVE fallback or gap fill.
    bool allowFallback{true};

    std::string key() const;
};

struct SubRangeOutcome {
    PlannedRange planned;
    std::vector<domain::SourcedBar> bars;
    bool ok{false};
    domain::FetchError error{};
    bool fellBack{false};
    // Some bars were produced by another caller's overlapping in-flight fetch.
    bool shared{false};
    std::size_t calls{0};
};

// Sub-ranges of one request and the outcomes filled in by the workers.
// Outcomes stay empty for sub-ranges that never finished.
class FetchBatch {
public:
    explicit FetchBatch(std::vector<PlannedRange> ranges);

    std::size_t size() const noexcept { return ranges_.size(); }
    const PlannedRange& range(std::size_t index) const { return ranges_.at(index); }

    std::optional<std::size_t> claim();
    void store(std::size_t index, SubRangeOutcome outcome);
    std::vector<std::optional<SubRangeOutcome>> outcomes() const;

private:
    const std::vector<PlannedRange> ranges_;
    std::atomic<std::size_t> next_{0};
    mutable std::mutex mutex_;
    std::vector<std::optional<SubRangeOutcome>> outcomes_;
};

// Long-lived dispatcher shared by all requests of a process. Remote calls
// in flight are registered per (context, source, span); a caller whose chunk
// overlaps a registered span waits for that call instead of repeating it and
// only fetches the parts nobody is fetching yet.
// Must be owned by a shared_ptr: workers keep it alive while they run.
class FetchCoordinator : public std::enable_shared_from_this<FetchCoordinator> {
public:
    FetchCoordinator(CoordinatorConfig config,
                     std::shared_ptr<domain::IBarSource> bulk,
                     std::shared_ptr<domain::IBarSource> live);

    FetchCoordinator(const FetchCoordinator&) = delete;
    FetchCoordinator& operator=(const FetchCoordinator&) = delete;

    // Spawns up to maxWorkers tasks on `scope`; results land in the batch.
    std::shared_ptr<FetchBatch> dispatch(const FetchContext& context,
                                         std::vector<PlannedRange> ranges,
                                         DeadlineScope& scope);

    SubRangeOutcome fetchSubRange(const FetchContext& context,
                                  const PlannedRange& planned,
                                  core::CancellationToken& cancel);

    // Remote calls currently registered, and callers waiting on them.
    std::size_t inFlight() const;
    std::size_t waitingFollowers() const;
    const CoordinatorConfig& config() const noexcept { return config_; }

private:
    struct InFlight;
    using BarsResult = domain::Result<std::vector<domain::Bar>>;

    struct ChunkRun {
        std::vector<domain::SourcedBar> bars;
        bool ok{false};
        bool shared{false};
        // Failure came from LIVE; no further fallback applies.
        bool terminal{false};
        domain::FetchError error{};
        domain::TimestampMs failedFrom{0};
        std::size_t calls{0};
    };

    class RateGate {
    public:
        void defer(domain::SourceTag source, std::chrono::steady_clock::time_point until);
        bool wait(domain::SourceTag source, core::CancellationToken& cancel);

    private:
        std::mutex mutex_;
        std::array<std::chrono::steady_clock::time_point, 3> until_{};
    };

    ChunkRun fetchChunks_(domain::IBarSource& source,
                          const FetchContext& context,
                          const domain::TimeRange& range,
                          core::CancellationToken& cancel,
                          bool fillGaps);
    BarsResult callShared_(domain::IBarSource& source,
                           const FetchContext& context,
                           const domain::TimeRange& chunk,
                           core::CancellationToken& cancel,
                           std::size_t& calls,
                           bool& shared);
    BarsResult callWithRetry_(domain::IBarSource& source,
                              const FetchContext& context,
                              const domain::TimeRange& chunk,
                              core::CancellationToken& cancel,
                              std::size_t& calls);
    BarsResult join_(const std::shared_ptr<InFlight>& entry,
                     domain::SourceTag tag,
                     core::CancellationToken& cancel);
    void publish_(const std::string& group, const std::shared_ptr<InFlight>& entry, const BarsResult& result);

    const CoordinatorConfig config_;
    std::shared_ptr<domain::IBarSource> bulk_;
    std::shared_ptr<domain::IBarSource> live_;
    RateGate rateGate_;

    mutable std::mutex inflightMutex_;
    // Disjoint spans per "context|source" group.
    std::unordered_map<std::string, std::vector<std::shared_ptr<InFlight>>> inflight_;
    std::size_t waitingFollowers_{0};
};

}  // namespace app
