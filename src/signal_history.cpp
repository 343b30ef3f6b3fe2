#include "signal_history.hpp"

namespace mabt {

std::vector<HistoryRow> buildSignalHistory(const std::vector<SignalEvent>& events) {
    std::vector<HistoryRow> rows;
    rows.reserve(events.size());
    for (const auto& ev : events) {
        HistoryRow row;
        row.date = ev.date;
        row.signal = signalLabel(ev.kind);
        row.price = ev.price;
        row.position_label = positionLabel(ev.position_after);
        row.portfolio_value = ev.portfolio_value;
        row.short_ma = ev.short_ma;
        row.long_ma = ev.long_ma;
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace mabt
