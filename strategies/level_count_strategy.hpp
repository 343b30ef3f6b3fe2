#pragma once

#include "strategy.hpp"
#include <memory>

namespace mabt {

/// Stateless level check on the latest bar against the long-window SMA.
/// Counts the trailing `window` bars whose close is below that bar's SMA:
/// BUY if fewer than window/2, otherwise SELL. No signal while the SMA is undefined.
std::unique_ptr<IStrategy> createLevelCountStrategy();

} // namespace mabt
