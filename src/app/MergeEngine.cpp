#include "app/MergeEngine.hpp"

#include <algorithm>

#include "domain/IntervalMath.hpp"

namespace app {
namespace {

using domain::SourcedBar;
using domain::TimeRange;
using domain::TimestampMs;

bool overlaps(const TimeRange& a, const TimeRange& b) { return a.start < b.end && b.start < a.end; }

GapKind classify(const GapWarning& gap, const domain::Interval& interval) {
    if (gap.missingBars == 1 && interval.ms < domain::kMillisPerDay &&
        domain::day_start(gap.range.start) == gap.range.start) {
        return GapKind::BoundaryTick;
    }
    return GapKind::Unexplained;
}

}  // namespace

const char* to_string(GapKind kind) noexcept {
    switch (kind) {
    case GapKind::BoundaryTick:
        return "boundary_tick";
    case GapKind::Unexplained:
        return "unexplained";
    }
    return "unknown";
}

std::size_t MergeResult::missingCount() const noexcept {
    return expectedCount > bars.size() ? expectedCount - bars.size() : 0;
}

bool MergeResult::hasUnexplainedGap() const noexcept {
    return std::any_of(gaps.begin(), gaps.end(), [](const GapWarning& gap) { return gap.kind == GapKind::Unexplained; });
}

MergeResult MergeEngine::merge(std::vector<SourcedBar> input,
                               const TimeRange& range,
                               const domain::Interval& interval) const {
    MergeResult result;

    std::vector<SourcedBar> candidates;
    candidates.reserve(input.size());
    for (auto& item : input) {
        if (!range.contains(item.bar.openTime) || !domain::is_aligned(item.bar.openTime, interval)) {
            ++result.droppedOutOfRange;
            continue;
        }
        candidates.push_back(item);
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const SourcedBar& lhs, const SourcedBar& rhs) {
        if (lhs.bar.openTime != rhs.bar.openTime) {
            return lhs.bar.openTime < rhs.bar.openTime;
        }
        return domain::priority_rank(lhs.source) < domain::priority_rank(rhs.source);
    });

    result.bars.reserve(candidates.size());
    for (const auto& item : candidates) {
        if (!result.bars.empty() && result.bars.back().bar.openTime == item.bar.openTime) {
            ++result.droppedDuplicates;
            continue;
        }
        result.bars.push_back(item);
    }

    result.expectedCount = domain::expected_count(range, interval);
    result.gaps = detectGaps(result.bars, range, interval);
    return result;
}

std::vector<GapWarning> MergeEngine::detectGaps(const std::vector<SourcedBar>& sorted,
                                                const TimeRange& range,
                                                const domain::Interval& interval) {
    std::vector<GapWarning> gaps;
    if (range.empty()) {
        return gaps;
    }

    std::size_t next = 0;
    bool open = false;
    GapWarning current{};

    const auto closeGap = [&](TimestampMs end) {
        current.range.end = end;
        current.kind = classify(current, interval);
        gaps.push_back(current);
        open = false;
    };

    for (auto t = domain::ceil_to_interval(range.start, interval); t < range.end;
         t = domain::next_open_time(t, interval)) {
        while (next < sorted.size() && sorted[next].bar.openTime < t) {
            ++next;
        }
        const bool present = next < sorted.size() && sorted[next].bar.openTime == t;
        if (present) {
            if (open) {
                closeGap(t);
            }
            continue;
        }
        if (!open) {
            current = GapWarning{};
            current.range.start = t;
            open = true;
        }
        ++current.missingBars;
    }
    if (open) {
        closeGap(range.end);
    }
    return gaps;
}

std::vector<CompletedDay> MergeEngine::completedDays(const MergeResult& merged,
                                                     const TimeRange& range,
                                                     const domain::Interval& interval,
                                                     TimestampMs now,
                                                     const std::vector<TimeRange>& blocked) const {
    std::vector<CompletedDay> days;
    if (!domain::divides_day(interval) || merged.bars.empty()) {
        return days;
    }

    const auto& bars = merged.bars;
    std::size_t begin = 0;
    while (begin < bars.size()) {
        const TimestampMs day = domain::day_start(bars[begin].bar.openTime);
        const TimestampMs dayEnd = day + domain::kMillisPerDay;
        std::size_t end = begin;
        bool fresh = false;
        while (end < bars.size() && bars[end].bar.openTime < dayEnd) {
            fresh = fresh || bars[end].source != domain::SourceTag::Cache;
            ++end;
        }

        const TimeRange dayRange{day, dayEnd};
        const bool covered = day >= range.start && dayEnd <= range.end;
        const bool closed = dayEnd <= now;
        const bool clear = std::none_of(blocked.begin(), blocked.end(),
                                        [&](const TimeRange& span) { return overlaps(span, dayRange); });

        if (covered && closed && clear && fresh) {
            const auto count = end - begin;
            CompletedDay completed{};
            completed.dayStart = day;
            if (count == domain::expected_count(dayRange, interval)) {
                completed.truncatedStart = false;
            } else if (begin == 0 && bars[begin].bar.openTime > day &&
                       count == domain::expected_count(TimeRange{bars[begin].bar.openTime, dayEnd}, interval)) {
                // Nothing before the first bar although it was requested: the
                // symbol started trading that day.
                completed.truncatedStart = true;
            } else {
                begin = end;
                continue;
            }
            completed.bars.reserve(count);
            for (auto i = begin; i < end; ++i) {
                completed.bars.push_back(bars[i].bar);
            }
            days.push_back(std::move(completed));
        }
        begin = end;
    }
    return days;
}

}  // namespace app
