#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/CancellationToken.hpp"
#include "domain/DomainContracts.h"
#include "domain/Types.h"

namespace domain {

// A remote source of closed bars. Implementations classify failures into
// SourceErrorClass values instead of throwing, and must reject ranges wider
// than max_rows_per_call() bars.
class IBarSource {
 public:
  virtual ~IBarSource() = default;

  virtual SourceTag tag() const = 0;
  virtual bool supports(const Interval& interval) const = 0;
  virtual std::size_t max_rows_per_call(const Interval& interval) const = 0;

  // Bars with range.start <= openTime < range.end, ascending.
  virtual Result<std::vector<Bar>> fetch_bars(const Symbol& symbol,
                                              const Interval& interval,
                                              const TimeRange& range,
                                              core::CancellationToken& cancel) = 0;
};

}  // namespace domain
