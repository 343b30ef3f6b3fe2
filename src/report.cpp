#include "report.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mabt {

namespace {

constexpr std::size_t RECENT_BARS = 5;

void writeCsvQuoted(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\"\"";
        else out << c;
    }
    out << '"';
}

void writeJsonString(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\\\"";
        else if (c == '\\') out << "\\\\";
        else if (c == '\n') out << "\\n";
        else if (c == '\r') out << "\\r";
        else out << c;
    }
    out << '"';
}

// CSV: undefined values are left empty
void writeCsvValue(std::ostream& out, const std::optional<double>& v) {
    if (v) out << *v;
}

void writeJsonValue(std::ostream& out, const std::optional<double>& v) {
    if (v) out << *v;
    else out << "null";
}

std::string money(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << "$" << v;
    return ss.str();
}

std::string money(const std::optional<double>& v) {
    return v ? money(*v) : "Undefined";
}

void printTable(const BatchReport& batch, std::ostream& out) {
    out << std::fixed << std::setprecision(2);
    out << std::setw(10) << "Ticker" << std::setw(8) << "Signal" << std::setw(16) << "Final value"
        << std::setw(14) << "Profit" << std::setw(12) << "ROI %" << std::setw(8) << "Trades" << "\n";
    out << std::string(68, '-') << "\n";
    for (const auto& o : batch.outcomes) {
        if (!o.ok()) continue;
        const TickerReport& r = *o.report;
        out << std::setw(10) << r.ticker << std::setw(8) << signalLabel(r.run.latest_signal)
            << std::setw(16) << formatValue(r.portfolio.final_value)
            << std::setw(14) << formatValue(r.portfolio.profit)
            << std::setw(12) << formatValue(r.portfolio.roi_percent)
            << std::setw(8) << r.run.trades.size() << "\n";
    }
    out << std::string(68, '-') << "\n";
    const AggregateResult& agg = batch.aggregate;
    out << std::setw(10) << "Combined" << std::setw(8) << ""
        << std::setw(16) << agg.total_final << std::setw(14) << agg.total_profit
        << std::setw(12) << formatValue(agg.total_roi_percent) << "\n";
    out << "  (Combined: " << agg.tickers << " accounts, " << std::setprecision(0)
        << agg.total_investment << " invested -> " << agg.total_final << " final)\n";
    out << std::setprecision(2);

    bool any_unavailable = false;
    for (const auto& o : batch.outcomes) {
        if (o.ok()) continue;
        if (!any_unavailable) out << "\nUnavailable:\n";
        any_unavailable = true;
        out << "  " << o.ticker << ": " << o.unavailable_reason << "\n";
    }
}

} // namespace

std::string formatValue(const std::optional<double>& v, int precision) {
    if (!v) return "Undefined";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << *v;
    return ss.str();
}

SeriesSummary summarizeSeries(const Series& series) {
    SeriesSummary s;
    if (series.empty()) return s;
    const auto& bars = series.bars();
    s.current_price = bars.back().close;
    s.latest_volume = bars.back().volume;
    if (bars.size() >= 2) {
        auto r = safeReturn(bars[bars.size() - 2].close, bars.back().close);
        if (r) s.daily_change_pct = *r * 100.0;
    }
    s.period_high = bars.front().high;
    s.period_low = bars.front().low;
    for (const Bar& b : bars) {
        s.period_high = std::max(s.period_high, b.high);
        s.period_low = std::min(s.period_low, b.low);
    }
    return s;
}

std::string signalBanner(const TickerReport& report) {
    const SignalRun& run = report.run;
    const int long_w = report.config.long_window;
    const int short_w = report.config.short_window;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);

    if (report.config.policy.kind == PolicyKind::LevelCount) {
        if (run.events.empty()) {
            ss << "HOLD: not enough history for a " << long_w << "-day MA";
            return ss.str();
        }
        const SignalEvent& ev = run.events.back();
        const bool buy = ev.kind == SignalKind::Buy;
        ss << (buy ? "BUY Signal: Price (" : "SELL Signal: Price (") << money(ev.price)
           << (buy ? ") is trending above " : ") is trending below ") << long_w
           << "-day MA (" << money(ev.long_ma) << ")";
        return ss.str();
    }

    if (run.events.empty()) {
        if (run.insufficient_history)
            ss << "HOLD: not enough history for a " << long_w << "-day MA";
        else
            ss << "HOLD: no " << short_w << "/" << long_w << "-day crossover in range";
        return ss.str();
    }

    const SignalEvent& ev = run.events.back();
    switch (ev.kind) {
        case SignalKind::Buy:
            ss << "BUY Signal: " << short_w << "-day MA (" << money(ev.short_ma) << ") crossed above "
               << long_w << "-day MA (" << money(ev.long_ma) << ") on " << ev.date;
            break;
        case SignalKind::Sell:
            ss << "SELL Signal: " << short_w << "-day MA (" << money(ev.short_ma) << ") crossed below "
               << long_w << "-day MA (" << money(ev.long_ma) << ") on " << ev.date;
            break;
        case SignalKind::Hold:
            ss << "HOLD: position open at " << money(ev.price) << ", marked value "
               << money(ev.portfolio_value);
            break;
    }
    return ss.str();
}

Report::Report(const TickerReport& report) : r_(report) {}

void Report::printSummary(std::ostream& out) const {
    const SeriesSummary s = summarizeSeries(r_.series);
    out << "\n========== " << r_.ticker << " ==========\n";
    out << "Policy: " << policyName(r_.config.policy.kind);
    if (r_.config.policy.kind == PolicyKind::ThresholdGatedCrossover)
        out << " (theta=" << r_.config.policy.theta << ")";
    out << "  windows " << r_.config.short_window << "/" << r_.config.long_window << "\n";
    out << std::fixed << std::setprecision(2);
    out << "Bars loaded:    " << r_.series.size();
    if (!r_.series.empty())
        out << " (" << r_.series.bars().front().date << " .. " << r_.series.back().date << ")";
    out << "\n";
    out << "Current price:  " << money(s.current_price) << "\n";
    out << "Daily change:   " << formatValue(s.daily_change_pct) << (s.daily_change_pct ? "%" : "") << "\n";
    out << "Volume:         " << s.latest_volume << "\n";
    out << "Period high:    " << money(s.period_high) << "\n";
    out << "Period low:     " << money(s.period_low) << "\n";

    out << "\nRecent data:\n";
    const auto& bars = r_.series.bars();
    const std::size_t first = bars.size() > RECENT_BARS ? bars.size() - RECENT_BARS : 0;
    for (std::size_t i = first; i < bars.size(); ++i) {
        const Bar& b = bars[i];
        out << "  " << b.date << "  O " << std::setw(9) << b.open << "  H " << std::setw(9) << b.high
            << "  L " << std::setw(9) << b.low << "  C " << std::setw(9) << b.close
            << "  V " << b.volume << "\n";
    }

    out << "\n" << signalBanner(r_) << "\n\n";
    out << "Initial value:  " << money(r_.portfolio.initial) << "\n";
    out << "Final value:    " << money(r_.portfolio.final_value) << "\n";
    out << "Profit:         " << money(r_.portfolio.profit) << "\n";
    out << "ROI:            " << formatValue(r_.portfolio.roi_percent) << (r_.portfolio.roi_percent ? "%" : "") << "\n";
    if (r_.config.policy.stateful()) {
        out << "Closed trades:  " << r_.run.trades.size() << "\n";
        out << "Max drawdown:   " << r_.max_drawdown_pct << "%\n";
        out << "Position:       " << positionLabel(r_.run.final_position) << "\n";
    } else {
        out << "(one-step estimate from the latest close vs MA, not a path simulation)\n";
    }

    out << "\nSignal history:\n";
    if (r_.history.empty()) {
        out << "  (no signals)\n";
    } else {
        out << std::setw(12) << "Date" << std::setw(6) << "Signal" << std::setw(11) << "Price"
            << std::setw(13) << "Position" << std::setw(14) << "Value"
            << std::setw(11) << "Short MA" << std::setw(11) << "Long MA" << "\n";
        for (const auto& row : r_.history) {
            out << std::setw(12) << row.date << std::setw(6) << row.signal << std::setw(11) << row.price
                << std::setw(13) << row.position_label << std::setw(14) << formatValue(row.portfolio_value)
                << std::setw(11) << formatValue(row.short_ma) << std::setw(11) << formatValue(row.long_ma) << "\n";
        }
    }
    out << "======================================\n";
}

bool Report::writeSignalHistory(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "date,signal,price,position,portfolio_value,short_ma,long_ma\n";
    f << std::fixed << std::setprecision(4);
    for (const auto& row : r_.history) {
        writeCsvQuoted(f, row.date);
        f << ',' << row.signal << ',' << row.price << ',';
        writeCsvQuoted(f, row.position_label);
        f << ',';
        writeCsvValue(f, row.portfolio_value);
        f << ',';
        writeCsvValue(f, row.short_ma);
        f << ',';
        writeCsvValue(f, row.long_ma);
        f << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write signal history: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "entry_date,exit_date,entry_price,exit_price,pnl,pnl_pct\n";
    f << std::fixed << std::setprecision(2);
    for (const auto& t : r_.run.trades) {
        writeCsvQuoted(f, t.entry_date);
        f << ',';
        writeCsvQuoted(f, t.exit_date);
        f << ',' << t.entry_price << ',' << t.exit_price << ',' << t.pnl << ',' << t.pnl_pct << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write trade log: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeEquityCurve(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "bar_index,date,equity\n";
    f << std::fixed << std::setprecision(2);
    const auto& curve = r_.run.equity_curve;
    const std::size_t n = std::min(curve.size(), r_.series.size());
    for (std::size_t i = 0; i < n; ++i) {
        f << i << ',';
        writeCsvQuoted(f, r_.series.at(i).date);
        f << ',';
        writeCsvValue(f, curve[i]);
        f << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write equity curve: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeSessionJson(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << std::fixed << std::setprecision(4);
    f << "{\n  \"symbol\": ";
    writeJsonString(f, r_.ticker);
    f << ",\n  \"policy\": ";
    writeJsonString(f, policyName(r_.config.policy.kind));
    f << ",\n  \"short_window\": " << r_.config.short_window
      << ",\n  \"long_window\": " << r_.config.long_window
      << ",\n  \"bars\": [\n";
    const auto& bars = r_.series.bars();
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const auto& b = bars[i];
        f << "    {\"t\":";
        writeJsonString(f, b.date);
        f << ",\"o\":" << b.open << ",\"h\":" << b.high << ",\"l\":" << b.low << ",\"c\":" << b.close
          << ",\"v\":" << b.volume << ",\"short_ma\":";
        writeJsonValue(f, i < r_.run.short_ma.size() ? r_.run.short_ma[i] : std::optional<double>{});
        f << ",\"long_ma\":";
        writeJsonValue(f, i < r_.run.long_ma.size() ? r_.run.long_ma[i] : std::optional<double>{});
        f << "}";
        if (i + 1 < bars.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n  \"signals\": [\n";
    const auto& events = r_.run.events;
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& ev = events[i];
        f << "    {\"t\":";
        writeJsonString(f, ev.date);
        f << ",\"signal\":\"" << signalLabel(ev.kind) << "\""
          << ",\"price\":" << ev.price
          << ",\"position\":\"" << positionLabel(ev.position_after) << "\""
          << ",\"value\":";
        writeJsonValue(f, ev.portfolio_value);
        f << "}";
        if (i + 1 < events.size()) f << ",";
        f << "\n";
    }
    f << "  ]\n}\n";
    if (!f) {
        std::cerr << "Failed to write session JSON: " << filepath << "\n";
        return false;
    }
    return true;
}

void printBatchSummary(const BatchReport& batch, std::ostream& out) {
    out << "\n========== Backtest (all tickers) ==========\n";
    out << "Policy: " << policyName(batch.config.policy.kind) << "  windows "
        << batch.config.short_window << "/" << batch.config.long_window
        << "  " << batch.config.start_date << " .. " << batch.config.end_date << "\n\n";
    printTable(batch, out);
    out << "============================================\n\n";
}

bool writeBatchSummary(const BatchReport& batch, const std::string& filepath) {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Backtest all tickers\nPolicy: " << policyName(batch.config.policy.kind)
      << " (short=" << batch.config.short_window << " long=" << batch.config.long_window << ")\n";
    f << "Range: " << batch.config.start_date << " .. " << batch.config.end_date << "\n\n";
    printTable(batch, f);
    for (const auto& w : batch.warnings) f << "Warning: " << w << "\n";
    if (!f) {
        std::cerr << "Failed to write batch summary: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace mabt
