#pragma once

#include "backtester.hpp"
#include <iostream>
#include <optional>
#include <ostream>
#include <string>

namespace mabt {

/// Headline statistics of a series (latest bar plus range extremes).
struct SeriesSummary {
    double current_price{0};
    std::optional<double> daily_change_pct;  // needs two bars
    std::int64_t latest_volume{0};
    double period_high{0};
    double period_low{0};
};

SeriesSummary summarizeSeries(const Series& series);

/// One-line signal message, e.g. "BUY Signal: Price ($187.20) is trending above 50-day MA ($180.11)".
std::string signalBanner(const TickerReport& report);

/// Fixed two-decimal value, or "Undefined".
std::string formatValue(const std::optional<double>& v, int precision = 2);

/// Console and file output for one ticker.
class Report {
public:
    explicit Report(const TickerReport& report);

    /// Print summary, banner, portfolio result and signal history.
    void printSummary(std::ostream& out = std::cout) const;

    /// Write signal history CSV. Returns false and logs to stderr on failure.
    bool writeSignalHistory(const std::string& filepath) const;

    /// Write closed trades CSV. Returns false and logs to stderr on failure.
    bool writeTradeLog(const std::string& filepath) const;

    /// Write equity curve CSV. Returns false and logs to stderr on failure.
    bool writeEquityCurve(const std::string& filepath) const;

    /// Write bars, both moving averages and signal events as JSON for a chart viewer.
    bool writeSessionJson(const std::string& filepath) const;

private:
    const TickerReport& r_;
};

/// Batch table with a Combined row, followed by unavailable tickers and reasons.
void printBatchSummary(const BatchReport& batch, std::ostream& out = std::cout);

/// Same table written to a text file. Returns false and logs to stderr on failure.
bool writeBatchSummary(const BatchReport& batch, const std::string& filepath);

} // namespace mabt
