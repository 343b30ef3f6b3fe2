#pragma once

#include "bar.hpp"
#include "data_source.hpp"
#include "signal.hpp"
#include "signal_engine.hpp"
#include "signal_history.hpp"
#include "simulator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mabt {

// Operational ranges enforced by clampConfig()
constexpr int MIN_SHORT_WINDOW = 5;
constexpr int MAX_SHORT_WINDOW = 100;
constexpr int MIN_LONG_WINDOW = 20;
constexpr int MAX_LONG_WINDOW = 200;
constexpr int MIN_LEVEL_WINDOW = 5;    // level policy uses long_window as its only MA
constexpr double MIN_INVESTMENT = 100.0;
constexpr double MAX_INVESTMENT = 1000000.0;

/// Immutable run configuration, passed by value into the core.
struct BacktestConfig {
    std::vector<std::string> tickers;
    std::string start_date;   // "YYYY-MM-DD", inclusive
    std::string end_date;     // "YYYY-MM-DD", inclusive
    int short_window{20};
    int long_window{50};
    double initial_investment{10000.0};
    SignalPolicy policy;
    Accounting accounting{Accounting::MarkToMarket};
    bool parallel{true};      // one task per ticker
};

/// Split "aapl, msft,,goog" into trimmed, uppercased, de-duplicated symbols.
std::vector<std::string> parseTickerList(const std::string& text);

/// Bring windows, investment and theta into their operational ranges and tidy the
/// ticker list. Each adjustment appends a message to `warnings` (if given).
/// short_window >= long_window is kept as is, with a warning.
BacktestConfig clampConfig(BacktestConfig config, std::vector<std::string>* warnings = nullptr);

/// Everything produced for one ticker.
struct TickerReport {
    std::string ticker;
    BacktestConfig config;        // clamped config actually used
    Series series;
    SignalRun run;
    std::vector<HistoryRow> history;
    PortfolioResult portfolio;
    double max_drawdown_pct{0};
};

/// Run the full chain (MA -> engine -> simulator -> history) on one series. Pure.
TickerReport runBacktest(BacktestConfig config, const Series& series);

/// Result slot for one ticker of a batch: a report, or why it was skipped.
struct TickerOutcome {
    std::string ticker;
    std::optional<TickerReport> report;
    std::string unavailable_reason;

    bool ok() const { return report.has_value(); }
};

struct BatchReport {
    BacktestConfig config;              // clamped
    std::vector<std::string> warnings;  // clamping messages
    std::vector<TickerOutcome> outcomes;  // same order as config.tickers
    AggregateResult aggregate;          // successful tickers only

    std::size_t successCount() const;
};

/// Fetch, normalize and backtest every ticker. A failing ticker is reported in its
/// outcome and never stops the others. With config.parallel each ticker runs in its
/// own task; the provider must then allow concurrent fetch() calls.
BatchReport runBatch(BacktestConfig config, const MarketDataProvider& provider);

} // namespace mabt
