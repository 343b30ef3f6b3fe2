#include "strategy.hpp"
#include "crossover_strategy.hpp"
#include "level_count_strategy.hpp"

namespace mabt {

std::unique_ptr<IStrategy> createStrategy(const SignalPolicy& policy) {
    switch (policy.kind) {
        case PolicyKind::LevelCount:
            return createLevelCountStrategy();
        case PolicyKind::PlainCrossover:
            return createCrossoverStrategy();
        case PolicyKind::ThresholdGatedCrossover: {
            CrossoverParams params;
            params.touch_gate = true;
            params.theta = policy.theta;
            return createCrossoverStrategy(params);
        }
    }
    return createCrossoverStrategy();
}

} // namespace mabt
