#include "level_count_strategy.hpp"
#include "context.hpp"
#include "bar.hpp"
#include <algorithm>
#include <memory>

namespace mabt {

class LevelCountStrategy : public IStrategy {
public:
    void onBar(const Bar& /*bar*/, IContext& /*ctx*/) override {}

    void onEnd(IContext& ctx) override {
        const Series& series = ctx.series();
        const int window = ctx.longWindow();
        if (series.empty() || window < 1) return;

        const std::size_t last = ctx.barIndex();
        if (!ctx.longMa(last)) return;

        const std::size_t lookback = std::min<std::size_t>(static_cast<std::size_t>(window), last + 1);
        int days_below = 0;
        for (std::size_t i = last + 1 - lookback; i <= last; ++i) {
            auto ma = ctx.longMa(i);
            if (ma && series.at(i).close < *ma) ++days_below;
        }

        // Exactly half counts as SELL
        if (days_below < window / 2.0)
            ctx.signal(SignalKind::Buy);
        else
            ctx.signal(SignalKind::Sell);
    }
};

std::unique_ptr<IStrategy> createLevelCountStrategy() {
    return std::make_unique<LevelCountStrategy>();
}

} // namespace mabt
