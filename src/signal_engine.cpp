#include "signal_engine.hpp"
#include "context.hpp"
#include "strategy.hpp"
#include <algorithm>
#include <memory>

namespace mabt {

namespace {

/// Concrete context passed to the strategy; turns signal requests into
/// simulator fills and recorded events.
class EngineContext : public IContext {
public:
    EngineContext(const EngineSettings& settings, const Series& series,
                  const MovingAverage& short_ma, const MovingAverage& long_ma,
                  Simulator& sim, std::vector<SignalEvent>& events)
        : settings_(settings), series_(series), short_ma_(short_ma), long_ma_(long_ma)
        , sim_(sim), events_(events) {}

    void signal(SignalKind kind) override {
        if (kind == SignalKind::Hold) return;
        if (!events_.empty() && events_.back().bar_index == bar_index_) return;  // one event per bar
        const Bar& bar = series_.at(bar_index_);

        if (!settings_.policy.stateful()) {
            auto ma = longMa(bar_index_);
            if (!ma) return;
            level_estimate_ = estimateLevelCountValue(settings_.initial_capital, kind, bar.close, *ma);
            has_level_signal_ = true;
            record(kind, Position::Flat, level_estimate_);  // no position is held
            return;
        }

        if (kind == SignalKind::Buy && sim_.position() == Position::Flat) {
            sim_.enterLong(bar);
            record(kind, Position::Long, sim_.markedValue());
        } else if (kind == SignalKind::Sell && sim_.position() == Position::Long) {
            sim_.exitLong(bar);
            record(kind, Position::Flat, sim_.markedValue());
        }
    }

    Position position() const override { return sim_.position(); }
    std::size_t barIndex() const override { return bar_index_; }
    const Series& series() const override { return series_; }

    std::optional<double> shortMa(std::size_t i) const override {
        if (i >= short_ma_.size()) return std::nullopt;
        return short_ma_[i];
    }
    std::optional<double> longMa(std::size_t i) const override {
        if (i >= long_ma_.size()) return std::nullopt;
        return long_ma_[i];
    }
    int longWindow() const override { return settings_.long_window; }

    void setBarIndex(std::size_t i) { bar_index_ = i; }

    /// Synthetic HOLD for a position still open after the last bar.
    void recordTerminalHold() {
        record(SignalKind::Hold, Position::Long, sim_.markedValue());
    }

    bool hasLevelSignal() const { return has_level_signal_; }
    std::optional<double> levelEstimate() const { return level_estimate_; }

private:
    void record(SignalKind kind, Position after, std::optional<double> value) {
        const Bar& bar = series_.at(bar_index_);
        SignalEvent ev;
        ev.bar_index = bar_index_;
        ev.date = bar.date;
        ev.kind = kind;
        ev.price = bar.close;
        ev.position_after = after;
        ev.portfolio_value = value;
        ev.short_ma = shortMa(bar_index_);
        ev.long_ma = longMa(bar_index_);
        events_.push_back(ev);
    }

    const EngineSettings& settings_;
    const Series& series_;
    const MovingAverage& short_ma_;
    const MovingAverage& long_ma_;
    Simulator& sim_;
    std::vector<SignalEvent>& events_;
    std::size_t bar_index_{0};
    bool has_level_signal_{false};
    std::optional<double> level_estimate_;
};

} // namespace

SignalEngine::SignalEngine(const EngineSettings& settings) : settings_(settings) {}

SignalRun SignalEngine::run(const Series& series) const {
    return run(series,
               simpleMovingAverage(series, settings_.short_window),
               simpleMovingAverage(series, settings_.long_window));
}

SignalRun SignalEngine::run(const Series& series, const MovingAverage& short_ma,
                            const MovingAverage& long_ma) const {
    SignalRun out;
    out.short_ma = short_ma;
    out.long_ma = long_ma;
    // Level policy reads only the long MA
    const int needed = settings_.policy.stateful()
        ? std::max(settings_.short_window, settings_.long_window)
        : settings_.long_window;
    out.insufficient_history = series.size() < static_cast<std::size_t>(needed);

    Simulator sim(settings_.initial_capital, settings_.accounting);
    if (series.empty()) {
        out.final_value = sim.markedValue();
        return out;
    }

    auto strategy = createStrategy(settings_.policy);
    EngineContext ctx(settings_, series, out.short_ma, out.long_ma, sim, out.events);
    strategy->onStart(ctx);

    for (std::size_t i = 0; i < series.size(); ++i) {
        const Bar& bar = series.at(i);
        ctx.setBarIndex(i);

        // 1. Revalue the position carried in from the previous bar
        sim.updateEquity(bar);

        // 2. Strategy sees the current bar and may open or close at its close
        strategy->onBar(bar, ctx);
    }

    strategy->onEnd(ctx);

    const std::size_t last = series.size() - 1;
    if (settings_.policy.stateful()) {
        if (sim.position() == Position::Long && (out.events.empty() || out.events.back().bar_index != last))
            ctx.recordTerminalHold();
        out.final_value = sim.markedValue();
    } else {
        out.final_value = ctx.hasLevelSignal() ? ctx.levelEstimate() : std::optional<double>(settings_.initial_capital);
    }

    out.trades = sim.trades();
    out.equity_curve = sim.equityCurve();
    out.final_position = sim.position();
    out.latest_signal = out.events.empty() ? SignalKind::Hold : out.events.back().kind;
    return out;
}

} // namespace mabt
