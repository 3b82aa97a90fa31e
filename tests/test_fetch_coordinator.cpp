#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app/DeadlineScope.hpp"
#include "app/FetchCoordinator.hpp"
#include "domain/IntervalMath.hpp"
#include "domain/exchange/IBarSource.hpp"

namespace {
using namespace std::chrono_literals;

using domain::Bar;
using domain::SourceTag;
using domain::TimeRange;
using domain::TimestampMs;
using BarsResult = domain::Result<std::vector<Bar>>;

bool waitForCondition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

std::vector<Bar> barsFor(const TimeRange& range, const domain::Interval& interval) {
    std::vector<Bar> bars;
    for (const auto t : domain::expected_open_times(range, interval)) {
        bars.push_back(Bar{t, 1.0, 2.0, 0.5, 1.5, 3.0});
    }
    return bars;
}

// Scripted IBarSource: `handler` receives the requested range and the
// 1-based call number.
class FakeSource : public domain::IBarSource {
public:
    using Handler = std::function<BarsResult(const TimeRange&, int)>;

    FakeSource(SourceTag tag, std::size_t maxRows, Handler handler)
        : tag_(tag), maxRows_(maxRows), handler_(std::move(handler)) {}

    SourceTag tag() const override { return tag_; }
    bool supports(const domain::Interval& interval) const override { return interval.valid(); }
    std::size_t max_rows_per_call(const domain::Interval&) const override { return maxRows_; }

    BarsResult fetch_bars(const domain::Symbol&,
                          const domain::Interval&,
                          const TimeRange& range,
                          core::CancellationToken&) override {
        const int call = calls_.fetch_add(1) + 1;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ranges_.push_back(range);
        }
        return handler_(range, call);
    }

    int calls() const { return calls_.load(); }

    std::vector<TimeRange> ranges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ranges_;
    }

private:
    SourceTag tag_;
    std::size_t maxRows_;
    Handler handler_;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::vector<TimeRange> ranges_;
};

app::CoordinatorConfig fastConfig(int attempts = 5) {
    app::CoordinatorConfig config{};
    config.maxWorkers = 4;
    config.retry.maxAttempts = attempts;
    config.retry.baseBackoff = 1ms;
    config.retry.maxBackoff = 10ms;
    config.retry.maxJitter = 0ms;
    return config;
}

}  // namespace

int main() {
    const auto oneMinute = domain::interval_from_label("1m");
    const auto day = domain::utc_timestamp(2024, 3, 1);
    const TimeRange hour{day, day + domain::kMillisPerHour};

    app::FetchContext context{};
    context.symbol = "BTCUSDT";
    context.interval = oneMinute;

    const auto serve = [oneMinute](const TimeRange& range, int) { return BarsResult::success(barsFor(range, oneMinute)); };

    {
        // Rate limited twice with a Retry-After hint, then served.
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, [&](const TimeRange& range, int call) {
            if (call <= 2) {
                return BarsResult::failure(
                    domain::source_error(domain::SourceErrorClass::RateLimited, "slow down", 20ms));
            }
            return serve(range, call);
        });
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), nullptr, live);
        core::CancellationToken cancel;
        const auto started = std::chrono::steady_clock::now();
        const auto outcome = coordinator->fetchSubRange(context, {hour, SourceTag::Live}, cancel);
        const auto elapsed = std::chrono::steady_clock::now() - started;
        if (!outcome.ok || outcome.bars.size() != 60 || live->calls() != 3 || outcome.calls != 3) {
            std::cerr << "Expected success on the third attempt (calls=" << live->calls() << ")\n";
            return 1;
        }
        if (elapsed < 40ms) {
            std::cerr << "Retry-After hint was not honoured\n";
            return 1;
        }
    }

    {
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, [](const TimeRange&, int) {
            return BarsResult::failure(domain::source_error(domain::SourceErrorClass::Network, "reset"));
        });
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(3), nullptr, live);
        core::CancellationToken cancel;
        const auto outcome = coordinator->fetchSubRange(context, {hour, SourceTag::Live}, cancel);
        if (outcome.ok || live->calls() != 3 || outcome.error.sourceClass != domain::SourceErrorClass::Network ||
            outcome.error.source != SourceTag::Live) {
            std::cerr << "Transient failures should stop after maxAttempts (calls=" << live->calls() << ")\n";
            return 1;
        }
    }

    {
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, [](const TimeRange&, int) {
            return BarsResult::failure(domain::source_error(domain::SourceErrorClass::InvalidRequest, "bad symbol"));
        });
        auto bulk = std::make_shared<FakeSource>(SourceTag::BulkHistorical, 1440, serve);
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), bulk, live);
        core::CancellationToken cancel;
        const auto outcome = coordinator->fetchSubRange(context, {hour, SourceTag::Live}, cancel);
        if (outcome.ok || live->calls() != 1 || bulk->calls() != 0) {
            std::cerr << "A LIVE failure must be terminal and never retried or redirected\n";
            return 1;
        }
    }

    {
        // Archive not published yet: the whole span comes from LIVE and is tagged so.
        auto bulk = std::make_shared<FakeSource>(SourceTag::BulkHistorical, 1440, [](const TimeRange&, int) {
            return BarsResult::failure(domain::source_error(domain::SourceErrorClass::NotYetAvailable, "404"));
        });
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, serve);
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), bulk, live);
        core::CancellationToken cancel;
        const auto outcome = coordinator->fetchSubRange(context, {hour, SourceTag::BulkHistorical}, cancel);
        if (!outcome.ok || !outcome.fellBack || bulk->calls() != 1 || outcome.bars.size() != 60) {
            std::cerr << "NotYetAvailable should fall back to LIVE once\n";
            return 1;
        }
        for (const auto& bar : outcome.bars) {
            if (bar.source != SourceTag::Live) {
                std::cerr << "Fallback bars must be tagged LIVE\n";
                return 1;
            }
        }
    }

    {
        // 250 bars with 100 rows per call: three ordered chunks.
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 100, serve);
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), nullptr, live);
        core::CancellationToken cancel;
        const TimeRange range{day, day + 250 * domain::kMillisPerMinute};
        const auto outcome = coordinator->fetchSubRange(context, {range, SourceTag::Live}, cancel);
        const auto ranges = live->ranges();
        if (!outcome.ok || outcome.bars.size() != 250 || ranges.size() != 3) {
            std::cerr << "Expected three chunks for 250 bars\n";
            return 1;
        }
        if (ranges[0] != TimeRange{day, day + 100 * domain::kMillisPerMinute} ||
            ranges[1] != TimeRange{day + 100 * domain::kMillisPerMinute, day + 200 * domain::kMillisPerMinute} ||
            ranges[2] != TimeRange{day + 200 * domain::kMillisPerMinute, range.end}) {
            std::cerr << "Chunks are not contiguous or out of order\n";
            return 1;
        }
    }

    {
        // One bar missing from the archive is requested from LIVE alone.
        const auto hole = day + 17 * domain::kMillisPerMinute;
        auto bulk = std::make_shared<FakeSource>(SourceTag::BulkHistorical, 1440, [&](const TimeRange& range, int) {
            auto bars = barsFor(range, oneMinute);
            bars.erase(bars.begin() + 17);
            return BarsResult::success(bars);
        });
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, serve);
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), bulk, live);
        core::CancellationToken cancel;
        const auto outcome = coordinator->fetchSubRange(context, {hour, SourceTag::BulkHistorical}, cancel);
        const auto liveRanges = live->ranges();
        if (!outcome.ok || outcome.fellBack || outcome.bars.size() != 60 || liveRanges.size() != 1 ||
            liveRanges[0] != TimeRange{hole, hole + domain::kMillisPerMinute}) {
            std::cerr << "Bulk hole should be filled by a single LIVE call\n";
            return 1;
        }
    }

    {
        // Enforced bulk: no fallback and no gap filling.
        auto bulk = std::make_shared<FakeSource>(SourceTag::BulkHistorical, 1440, [](const TimeRange&, int) {
            return BarsResult::failure(domain::source_error(domain::SourceErrorClass::NotYetAvailable, "404"));
        });
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, serve);
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), bulk, live);
        core::CancellationToken cancel;
        auto strict = context;
        strict.allowFallback = false;
        const auto outcome = coordinator->fetchSubRange(strict, {hour, SourceTag::BulkHistorical}, cancel);
        if (outcome.ok || outcome.fellBack || live->calls() != 0 ||
            outcome.error.sourceClass != domain::SourceErrorClass::NotYetAvailable) {
            std::cerr << "Strict bulk fetch must not touch LIVE\n";
            return 1;
        }

        auto noBulk = std::make_shared<app::FetchCoordinator>(fastConfig(), nullptr, live);
        const auto missing = noBulk->fetchSubRange(strict, {hour, SourceTag::BulkHistorical}, cancel);
        if (missing.ok || missing.error.sourceClass != domain::SourceErrorClass::InvalidRequest || live->calls() != 0) {
            std::cerr << "Strict bulk fetch without a bulk source must fail\n";
            return 1;
        }
    }

    {
        // Identical concurrent requests share one remote call.
        std::mutex gateMutex;
        std::condition_variable gateCv;
        bool open = false;
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, [&](const TimeRange& range, int call) {
            std::unique_lock<std::mutex> lock(gateMutex);
            gateCv.wait(lock, [&]() { return open; });
            return serve(range, call);
        });
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), nullptr, live);

        constexpr std::size_t kCallers = 5;
        std::vector<app::SubRangeOutcome> outcomes(kCallers);
        std::vector<std::unique_ptr<core::CancellationToken>> tokens;
        std::vector<std::thread> callers;
        for (std::size_t i = 0; i < kCallers; ++i) {
            tokens.push_back(std::make_unique<core::CancellationToken>());
        }
        for (std::size_t i = 0; i < kCallers; ++i) {
            callers.emplace_back([&, i]() {
                outcomes[i] = coordinator->fetchSubRange(context, {hour, SourceTag::Live}, *tokens[i]);
            });
        }

        const bool joined = waitForCondition([&]() { return coordinator->waitingFollowers() == kCallers - 1; }, 2000ms);
        {
            std::lock_guard<std::mutex> lock(gateMutex);
            open = true;
        }
        gateCv.notify_all();
        for (auto& caller : callers) {
            caller.join();
        }

        if (!joined) {
            std::cerr << "Followers never joined the in-flight fetch\n";
            return 1;
        }
        std::size_t shared = 0;
        for (const auto& outcome : outcomes) {
            if (!outcome.ok || outcome.bars.size() != 60) {
                std::cerr << "Every caller should receive the full result\n";
                return 1;
            }
            shared += outcome.shared ? 1 : 0;
        }
        if (live->calls() != 1 || shared != kCallers - 1 || coordinator->inFlight() != 0 ||
            coordinator->waitingFollowers() != 0) {
            std::cerr << "Expected one remote call for " << kCallers << " callers (calls=" << live->calls() << ")\n";
            return 1;
        }
    }

    {
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, serve);
        auto bulk = std::make_shared<FakeSource>(SourceTag::BulkHistorical, 1440, serve);
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), bulk, live);
        app::DeadlineScope scope({5000ms, 100ms});
        std::vector<app::PlannedRange> ranges{
            {TimeRange{day, day + domain::kMillisPerDay}, SourceTag::BulkHistorical},
            {TimeRange{day + domain::kMillisPerDay, day + 2 * domain::kMillisPerDay}, SourceTag::BulkHistorical},
            {TimeRange{day + 2 * domain::kMillisPerDay, day + 2 * domain::kMillisPerDay + domain::kMillisPerHour},
             SourceTag::Live},
        };
        auto batch = coordinator->dispatch(context, ranges, scope);
        const auto result = scope.wait();
        if (!result.completed || result.failedTasks != 0) {
            std::cerr << "Dispatch should complete inside the deadline\n";
            return 1;
        }
        std::size_t total = 0;
        for (const auto& outcome : batch->outcomes()) {
            if (!outcome || !outcome->ok) {
                std::cerr << "Every dispatched sub-range should succeed\n";
                return 1;
            }
            total += outcome->bars.size();
        }
        if (total != 2 * 1440 + 60 || bulk->calls() != 2 || live->calls() != 1) {
            std::cerr << "Unexpected dispatch totals (" << total << " bars)\n";
            return 1;
        }
    }

    {
        // Every permanent bulk failure is retried once through LIVE.
        for (const auto errorClass : {domain::SourceErrorClass::NotYetAvailable, domain::SourceErrorClass::ChecksumMismatch,
                                      domain::SourceErrorClass::NotFound}) {
            auto bulk = std::make_shared<FakeSource>(SourceTag::BulkHistorical, 1440, [errorClass](const TimeRange&, int) {
                return BarsResult::failure(domain::source_error(errorClass, "archive rejected"));
            });
            auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, serve);
            auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), bulk, live);
            core::CancellationToken cancel;
            const auto outcome = coordinator->fetchSubRange(context, {hour, SourceTag::BulkHistorical}, cancel);
            if (!outcome.ok || !outcome.fellBack || bulk->calls() != 1 || live->calls() != 1 ||
                outcome.bars.size() != 60) {
                std::cerr << "Bulk " << domain::to_string(errorClass) << " should fall back to LIVE once\n";
                return 1;
            }
            for (const auto& bar : outcome.bars) {
                if (bar.source != SourceTag::Live) {
                    std::cerr << "Fallback bars after " << domain::to_string(errorClass) << " must be tagged LIVE\n";
                    return 1;
                }
            }
        }
    }

    {
        // A bulk span starting mid-day is cut at every UTC midnight.
        auto bulk = std::make_shared<FakeSource>(SourceTag::BulkHistorical, 1440, serve);
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, serve);
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), bulk, live);
        core::CancellationToken cancel;
        const auto from = day + 10 * domain::kMillisPerHour;
        const TimeRange range{from, day + 3 * domain::kMillisPerDay};
        const auto outcome = coordinator->fetchSubRange(context, {range, SourceTag::BulkHistorical}, cancel);
        const auto ranges = bulk->ranges();
        if (!outcome.ok || outcome.bars.size() != 14 * 60 + 2 * 1440 || ranges.size() != 3) {
            std::cerr << "Expected one bulk call per UTC day (calls=" << bulk->calls() << ")\n";
            return 1;
        }
        if (ranges[0] != TimeRange{from, day + domain::kMillisPerDay} ||
            ranges[1] != TimeRange{day + domain::kMillisPerDay, day + 2 * domain::kMillisPerDay} ||
            ranges[2] != TimeRange{day + 2 * domain::kMillisPerDay, range.end}) {
            std::cerr << "Bulk chunks must not cross midnight\n";
            return 1;
        }
    }

    {
        // Overlapping bulk requests share the remote call for the common day.
        const auto day2 = day + domain::kMillisPerDay;
        const auto day3 = day + 2 * domain::kMillisPerDay;
        std::mutex gateMutex;
        std::condition_variable gateCv;
        bool open = false;
        auto bulk = std::make_shared<FakeSource>(SourceTag::BulkHistorical, 1440, [&](const TimeRange& range, int call) {
            if (range.start == day2) {
                std::unique_lock<std::mutex> lock(gateMutex);
                gateCv.wait(lock, [&]() { return open; });
            }
            return serve(range, call);
        });
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, serve);
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), bulk, live);

        core::CancellationToken first;
        core::CancellationToken second;
        app::SubRangeOutcome narrow;
        app::SubRangeOutcome wide;
        std::thread narrowCaller([&]() {
            narrow = coordinator->fetchSubRange(context, {TimeRange{day2, day3}, SourceTag::BulkHistorical}, first);
        });
        const bool started = waitForCondition([&]() { return bulk->calls() == 1; }, 2000ms);
        std::thread wideCaller([&]() {
            wide = coordinator->fetchSubRange(context, {TimeRange{day, day3}, SourceTag::BulkHistorical}, second);
        });
        const bool joined = waitForCondition([&]() { return coordinator->waitingFollowers() == 1; }, 2000ms);
        {
            std::lock_guard<std::mutex> lock(gateMutex);
            open = true;
        }
        gateCv.notify_all();
        narrowCaller.join();
        wideCaller.join();

        if (!started || !joined) {
            std::cerr << "Overlapping request never joined the in-flight day\n";
            return 1;
        }
        std::size_t day2Calls = 0;
        for (const auto& range : bulk->ranges()) {
            day2Calls += range.start < day3 && day2 < range.end ? 1U : 0U;
        }
        if (!narrow.ok || !wide.ok || narrow.bars.size() != 1440 || wide.bars.size() != 2 * 1440 ||
            bulk->calls() != 2 || day2Calls != 1 || !wide.shared || narrow.shared || wide.calls != 1) {
            std::cerr << "Expected a single remote call covering the shared day (calls=" << bulk->calls() << ")\n";
            return 1;
        }
        for (std::size_t i = 1; i < wide.bars.size(); ++i) {
            if (wide.bars[i].bar.openTime != wide.bars[i - 1].bar.openTime + domain::kMillisPerMinute) {
                std::cerr << "Joined bars are not contiguous\n";
                return 1;
            }
        }
    }

    {
        // Partial overlap: only the part nobody is fetching goes out.
        std::mutex gateMutex;
        std::condition_variable gateCv;
        bool open = false;
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, [&](const TimeRange& range, int call) {
            if (range.start == day) {
                std::unique_lock<std::mutex> lock(gateMutex);
                gateCv.wait(lock, [&]() { return open; });
            }
            return serve(range, call);
        });
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), nullptr, live);

        core::CancellationToken first;
        core::CancellationToken second;
        app::SubRangeOutcome early;
        app::SubRangeOutcome late;
        std::thread earlyCaller([&]() {
            early = coordinator->fetchSubRange(
                context, {TimeRange{day, day + 2 * domain::kMillisPerHour}, SourceTag::Live}, first);
        });
        const bool started = waitForCondition([&]() { return live->calls() == 1; }, 2000ms);
        std::thread lateCaller([&]() {
            late = coordinator->fetchSubRange(
                context,
                {TimeRange{day + domain::kMillisPerHour, day + 3 * domain::kMillisPerHour}, SourceTag::Live},
                second);
        });
        const bool joined = waitForCondition([&]() { return coordinator->waitingFollowers() == 1; }, 2000ms);
        {
            std::lock_guard<std::mutex> lock(gateMutex);
            open = true;
        }
        gateCv.notify_all();
        earlyCaller.join();
        lateCaller.join();

        const auto ranges = live->ranges();
        if (!started || !joined || !early.ok || !late.ok || early.bars.size() != 120 || late.bars.size() != 120 ||
            ranges.size() != 2 ||
            ranges[1] != TimeRange{day + 2 * domain::kMillisPerHour, day + 3 * domain::kMillisPerHour}) {
            std::cerr << "Partially overlapping request should fetch only its uncovered hour\n";
            return 1;
        }
        if (late.bars.front().bar.openTime != day + domain::kMillisPerHour ||
            late.bars.back().bar.openTime != day + 3 * domain::kMillisPerHour - domain::kMillisPerMinute) {
            std::cerr << "Shared bars were not trimmed to the requested range\n";
            return 1;
        }
    }

    {
        // A call stuck past force release no longer holds its span.
        std::mutex gateMutex;
        std::condition_variable gateCv;
        bool open = false;
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, [&](const TimeRange& range, int call) {
            if (call == 1) {
                std::unique_lock<std::mutex> lock(gateMutex);
                gateCv.wait(lock, [&]() { return open; });
            }
            return serve(range, call);
        });
        auto coordinator = std::make_shared<app::FetchCoordinator>(fastConfig(), nullptr, live);

        core::CancellationToken stuckToken;
        core::CancellationToken followerToken;
        app::SubRangeOutcome stuck;
        app::SubRangeOutcome follower;
        std::thread stuckCaller([&]() { stuck = coordinator->fetchSubRange(context, {hour, SourceTag::Live}, stuckToken); });
        const bool started = waitForCondition([&]() { return live->calls() == 1; }, 2000ms);
        std::thread followerCaller(
            [&]() { follower = coordinator->fetchSubRange(context, {hour, SourceTag::Live}, followerToken); });
        const bool joined = waitForCondition([&]() { return coordinator->waitingFollowers() == 1; }, 2000ms);

        stuckToken.cancel("deadline exceeded");
        stuckToken.force_release();
        followerCaller.join();

        core::CancellationToken freshToken;
        const auto fresh = coordinator->fetchSubRange(context, {hour, SourceTag::Live}, freshToken);
        const int callsWhileStuck = live->calls();

        {
            std::lock_guard<std::mutex> lock(gateMutex);
            open = true;
        }
        gateCv.notify_all();
        stuckCaller.join();

        if (!started || !joined) {
            std::cerr << "Setup for the stuck call did not happen\n";
            return 1;
        }
        if (!follower.ok || follower.bars.size() != 60 || !fresh.ok || fresh.shared || callsWhileStuck != 3) {
            std::cerr << "Callers must not wait on a force released fetch (calls=" << callsWhileStuck << ")\n";
            return 1;
        }
        if (coordinator->inFlight() != 0 || coordinator->waitingFollowers() != 0) {
            std::cerr << "In-flight table not empty after the stuck call returned\n";
            return 1;
        }
    }

    {
        // No more collaborator calls at once than maxWorkers.
        std::atomic<int> active{0};
        std::atomic<int> peak{0};
        auto live = std::make_shared<FakeSource>(SourceTag::Live, 1000, [&](const TimeRange& range, int call) {
            const int now = active.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(20ms);
            active.fetch_sub(1);
            return serve(range, call);
        });
        auto config = fastConfig();
        config.maxWorkers = 2;
        auto coordinator = std::make_shared<app::FetchCoordinator>(config, nullptr, live);

        std::vector<app::PlannedRange> ranges;
        for (int i = 0; i < 6; ++i) {
            const auto from = day + i * domain::kMillisPerHour;
            ranges.push_back({TimeRange{from, from + domain::kMillisPerHour}, SourceTag::Live});
        }
        app::DeadlineScope scope({5000ms, 100ms});
        auto batch = coordinator->dispatch(context, ranges, scope);
        const auto result = scope.wait();
        if (!result.completed || live->calls() != 6 || peak.load() > 2 || peak.load() < 1) {
            std::cerr << "Worker limit exceeded (peak=" << peak.load() << " calls=" << live->calls() << ")\n";
            return 1;
        }
        for (const auto& outcome : batch->outcomes()) {
            if (!outcome || !outcome->ok) {
                std::cerr << "Every sub-range should succeed under the worker limit\n";
                return 1;
            }
        }
    }

    return 0;
}
