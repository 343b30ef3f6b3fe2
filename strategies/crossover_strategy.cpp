#include "crossover_strategy.hpp"
#include "context.hpp"
#include "bar.hpp"
#include <cmath>
#include <memory>

namespace mabt {

class CrossoverStrategy : public IStrategy {
public:
    explicit CrossoverStrategy(const CrossoverParams& params) : p_(params) {}

    void onBar(const Bar& bar, IContext& ctx) override {
        const std::size_t i = ctx.barIndex();
        if (i == 0) return;  // nothing to compare against

        auto fast = ctx.shortMa(i);
        auto slow = ctx.longMa(i);
        if (!fast || !slow) return;  // insufficient history

        if (ctx.position() == Position::Flat) {
            if (!(*fast > *slow)) return;
            // One buy per crossing: skip if the previous bar was already above
            if (wasAbove(ctx, i - 1)) return;
            if (!touching(bar.close, *fast, *slow)) return;
            ctx.signal(SignalKind::Buy);
            return;
        }

        if (*fast < *slow && touching(bar.close, *fast, *slow))
            ctx.signal(SignalKind::Sell);
    }

private:
    static bool wasAbove(const IContext& ctx, std::size_t i) {
        auto fast = ctx.shortMa(i);
        auto slow = ctx.longMa(i);
        return fast && slow && *fast > *slow;
    }

    bool touching(double close, double fast, double slow) const {
        if (!p_.touch_gate) return true;
        if (close == 0) return false;
        return std::abs(close - fast) / close <= p_.theta
            || std::abs(close - slow) / close <= p_.theta;
    }

    CrossoverParams p_;
};

std::unique_ptr<IStrategy> createCrossoverStrategy(const CrossoverParams& params) {
    return std::make_unique<CrossoverStrategy>(params);
}

} // namespace mabt
