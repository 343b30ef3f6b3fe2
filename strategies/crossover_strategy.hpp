#pragma once

#include "strategy.hpp"
#include <memory>

namespace mabt {

/// Short/long SMA crossover with position gating.
/// Buy when short crosses above long while flat (the previous bar was not already above).
/// Sell when short is below long while long. Equal averages never trigger.
/// With touch_gate, a transition also needs |close - ma| / close <= theta for either average.
struct CrossoverParams {
    bool touch_gate = false;
    double theta = 0.001;
};

std::unique_ptr<IStrategy> createCrossoverStrategy(const CrossoverParams& params = CrossoverParams{});

} // namespace mabt
