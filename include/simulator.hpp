#pragma once

#include "bar.hpp"
#include "signal.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mabt {

/// How an open long position is valued while it is held.
enum class Accounting {
    MarkToMarket,    // equity compounds with every close while long
    RealizedAtExit   // equity moves only when the position is closed
};

/// Single closed round trip for reporting.
struct Trade {
    std::string entry_date;
    std::string exit_date;
    double entry_price{0};
    double exit_price{0};
    double pnl{0};
    double pnl_pct{0};
};

/// Simple return (to - from) / from. nullopt when from is zero or the result is not finite.
std::optional<double> safeReturn(double from, double to);

/// Single-position, full-reinvestment account. Fills happen at the bar's close.
/// Per bar: updateEquity(bar) first, then at most one enterLong/exitLong on the same bar.
/// Once a division by zero occurs the account value becomes undefined for the rest of the run.
class Simulator {
public:
    explicit Simulator(double initial_capital, Accounting accounting = Accounting::MarkToMarket);

    /// Revalue the account for this bar's close and append to the equity curve.
    void updateEquity(const Bar& bar);

    /// Open a long position at bar.close. No-op when already long.
    void enterLong(const Bar& bar);

    /// Close the long position at bar.close and record the trade. No-op when flat.
    void exitLong(const Bar& bar);

    Position position() const { return position_; }
    std::optional<double> entryPrice() const { return entry_price_; }
    double initialCapital() const { return initial_capital_; }
    Accounting accounting() const { return accounting_; }

    /// Account value under the chosen accounting (booked value for RealizedAtExit).
    std::optional<double> equity() const;

    /// Value including any unrealized gain on an open position at the last close.
    std::optional<double> markedValue() const;

    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<std::optional<double>>& equityCurve() const { return equity_curve_; }

private:
    double initial_capital_;
    Accounting accounting_;
    double equity_;
    bool undefined_{false};
    Position position_{Position::Flat};
    std::optional<double> entry_price_;
    double entry_equity_{0};
    std::string entry_date_;
    double last_close_{0};
    bool has_close_{false};

    std::vector<Trade> trades_;
    std::vector<std::optional<double>> equity_curve_;
};

/// Final value, profit and ROI for one ticker. Undefined values are nullopt.
struct PortfolioResult {
    double initial{0};
    std::optional<double> final_value;
    std::optional<double> profit;
    std::optional<double> roi_percent;
};

/// profit = final - initial, roi = profit / initial * 100 (undefined when initial is 0).
PortfolioResult makePortfolioResult(double initial, std::optional<double> final_value);

/// Totals across tickers; ROI is computed from the sums, not averaged.
struct AggregateResult {
    int tickers{0};
    double total_investment{0};
    double total_final{0};
    double total_profit{0};
    std::optional<double> total_roi_percent;
};

/// Results whose final value is undefined are left out of the totals.
AggregateResult aggregateResults(const std::vector<PortfolioResult>& results);

/// One-step estimate for the level-count policy:
/// BUY: C0 * (1 + (close - ma)/ma), SELL: C0 * (1 - (close - ma)/ma). Not a path simulation.
/// nullopt when ma is zero. HOLD returns C0.
std::optional<double> estimateLevelCountValue(double initial, SignalKind kind, double close, double ma);

/// Largest peak-to-trough decline of the curve in percent; undefined points are skipped.
double maxDrawdownPct(const std::vector<std::optional<double>>& curve);

} // namespace mabt
