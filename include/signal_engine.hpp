#pragma once

#include "bar.hpp"
#include "moving_average.hpp"
#include "signal.hpp"
#include "simulator.hpp"
#include <optional>
#include <vector>

namespace mabt {

/// Everything one engine run needs besides the series.
struct EngineSettings {
    SignalPolicy policy;
    Accounting accounting{Accounting::MarkToMarket};
    double initial_capital{10000.0};
    int short_window{20};
    int long_window{50};
};

/// Output of one engine run over one series.
struct SignalRun {
    std::vector<SignalEvent> events;
    MovingAverage short_ma;
    MovingAverage long_ma;
    std::vector<Trade> trades;
    std::vector<std::optional<double>> equity_curve;
    Position final_position{Position::Flat};
    std::optional<double> final_value;     // nullopt = undefined
    SignalKind latest_signal{SignalKind::Hold};
    bool insufficient_history{false};      // series shorter than the larger window
};

/// Walks a series bar by bar in date order, feeding the policy's strategy and the
/// simulator. Stateless between runs: the same input always yields the same output.
///
/// Stateful policies: at most one event per bar, index 0 never produces one, and a
/// run that ends long gets a synthetic HOLD on the last bar (unless that bar already
/// has an event) carrying the marked-to-market value.
/// LevelCount: at most one BUY/SELL event on the last bar, valued with the one-step estimate.
class SignalEngine {
public:
    explicit SignalEngine(const EngineSettings& settings);

    /// Compute both moving averages and run.
    SignalRun run(const Series& series) const;

    /// Run with precomputed averages (must be aligned to the series).
    SignalRun run(const Series& series, const MovingAverage& short_ma, const MovingAverage& long_ma) const;

    const EngineSettings& settings() const { return settings_; }

private:
    EngineSettings settings_;
};

} // namespace mabt
