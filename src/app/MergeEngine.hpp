#pragma once

#include <cstddef>
#include <vector>

#include "domain/Types.h"

namespace app {

enum class GapKind {
    // A single missing bar at UTC midnight: the exchange skips that tick in
    // some daily exports.
    BoundaryTick,
    Unexplained,
};

const char* to_string(GapKind kind) noexcept;

struct GapWarning {
    domain::TimeRange range;
    std::size_t missingBars{0};
    GapKind kind{GapKind::Unexplained};
};

struct MergeResult {
    std::vector<domain::SourcedBar> bars;
    std::size_t expectedCount{0};
    std::vector<GapWarning> gaps;
    std::size_t droppedDuplicates{0};
    std::size_t droppedOutOfRange{0};

    std::size_t missingCount() const noexcept;
    bool hasUnexplainedGap() const noexcept;
};

// A UTC day of merged bars that is ready to be written to the cache.
struct CompletedDay {
    domain::TimestampMs dayStart{0};
    std::vector<domain::Bar> bars;
    bool truncatedStart{false};
};

class MergeEngine {
public:
    // Sorts by open time, keeps the highest priority bar on collisions and
    // drops bars that are misaligned or outside `range`.
    MergeResult merge(std::vector<domain::SourcedBar> input,
                      const domain::TimeRange& range,
                      const domain::Interval& interval) const;

    static std::vector<GapWarning> detectGaps(const std::vector<domain::SourcedBar>& sorted,
                                              const domain::TimeRange& range,
                                              const domain::Interval& interval);

    // Closed days fully covered by `range` whose bars are complete and that
    // contain at least one bar not read from the cache. `blocked` spans
    // (failed or unfinished fetches) disqualify every day they touch.
    std::vector<CompletedDay> completedDays(const MergeResult& merged,
                                            const domain::TimeRange& range,
                                            const domain::Interval& interval,
                                            domain::TimestampMs now,
                                            const std::vector<domain::TimeRange>& blocked = {}) const;
};

}  // namespace app
