#pragma once

#include "bar.hpp"
#include <optional>
#include <vector>

namespace mabt {

/// Per-bar moving average aligned to the series by index. Absent while history is short.
using MovingAverage = std::vector<std::optional<double>>;

/// Trailing simple moving average of closes over `window` bars.
/// Index i holds mean(close[i-window+1 .. i]) when i >= window-1, otherwise nullopt.
/// window < 1 gives all nullopt.
MovingAverage simpleMovingAverage(const std::vector<double>& closes, int window);
MovingAverage simpleMovingAverage(const Series& series, int window);

} // namespace mabt
