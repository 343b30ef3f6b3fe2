#pragma once

#include "signal.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mabt {

/// Display row of the signal history.
struct HistoryRow {
    std::string date;
    std::string signal;          // "BUY", "SELL", "HOLD"
    double price{0};
    std::string position_label;  // "Holding" / "Not Holding"
    std::optional<double> portfolio_value;
    std::optional<double> short_ma;
    std::optional<double> long_ma;
};

/// Project engine events to display rows, same order, inputs untouched.
std::vector<HistoryRow> buildSignalHistory(const std::vector<SignalEvent>& events);

} // namespace mabt
