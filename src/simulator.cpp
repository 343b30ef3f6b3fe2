#include "simulator.hpp"
#include <cmath>
#include <algorithm>

namespace mabt {

std::optional<double> safeReturn(double from, double to) {
    if (from == 0) return std::nullopt;
    double r = (to - from) / from;
    if (!std::isfinite(r)) return std::nullopt;
    return r;
}

Simulator::Simulator(double initial_capital, Accounting accounting)
    : initial_capital_(initial_capital)
    , accounting_(accounting)
    , equity_(initial_capital)
{
}

void Simulator::updateEquity(const Bar& bar) {
    if (position_ == Position::Long && accounting_ == Accounting::MarkToMarket && !undefined_) {
        auto r = has_close_ ? safeReturn(last_close_, bar.close) : std::optional<double>{};
        if (r)
            equity_ *= (1.0 + *r);
        else
            undefined_ = true;
    }
    last_close_ = bar.close;
    has_close_ = true;
    equity_curve_.push_back(equity());
}

void Simulator::enterLong(const Bar& bar) {
    if (position_ == Position::Long) return;
    position_ = Position::Long;
    entry_price_ = bar.close;
    entry_equity_ = equity_;
    entry_date_ = bar.date;
    last_close_ = bar.close;
    has_close_ = true;
}

void Simulator::exitLong(const Bar& bar) {
    if (position_ == Position::Flat) return;

    const double entry = entry_price_.value_or(0);
    auto r = safeReturn(entry, bar.close);
    if (accounting_ == Accounting::RealizedAtExit && !undefined_) {
        if (r)
            equity_ *= (1.0 + *r);
        else
            undefined_ = true;
    }

    Trade t;
    t.entry_date = entry_date_;
    t.exit_date = bar.date;
    t.entry_price = entry;
    t.exit_price = bar.close;
    t.pnl = undefined_ ? 0 : equity_ - entry_equity_;
    t.pnl_pct = r ? *r * 100.0 : 0;
    trades_.push_back(t);

    position_ = Position::Flat;
    entry_price_.reset();
    entry_date_.clear();
    last_close_ = bar.close;

    // Keep the curve's last point in step with the booked value on this bar
    if (!equity_curve_.empty()) equity_curve_.back() = equity();
}

std::optional<double> Simulator::equity() const {
    if (undefined_) return std::nullopt;
    return equity_;
}

std::optional<double> Simulator::markedValue() const {
    if (undefined_) return std::nullopt;
    if (position_ == Position::Flat || accounting_ == Accounting::MarkToMarket) return equity_;
    auto r = safeReturn(entry_price_.value_or(0), last_close_);
    if (!r) return std::nullopt;
    return equity_ * (1.0 + *r);
}

PortfolioResult makePortfolioResult(double initial, std::optional<double> final_value) {
    PortfolioResult res;
    res.initial = initial;
    if (!final_value || !std::isfinite(*final_value)) return res;
    res.final_value = final_value;
    res.profit = *final_value - initial;
    if (initial != 0) res.roi_percent = *res.profit / initial * 100.0;
    return res;
}

AggregateResult aggregateResults(const std::vector<PortfolioResult>& results) {
    AggregateResult agg;
    for (const auto& r : results) {
        if (!r.final_value) continue;
        ++agg.tickers;
        agg.total_investment += r.initial;
        agg.total_final += *r.final_value;
    }
    agg.total_profit = agg.total_final - agg.total_investment;
    if (agg.total_investment != 0)
        agg.total_roi_percent = agg.total_profit / agg.total_investment * 100.0;
    return agg;
}

std::optional<double> estimateLevelCountValue(double initial, SignalKind kind, double close, double ma) {
    if (kind == SignalKind::Hold) return initial;
    auto r = safeReturn(ma, close);
    if (!r) return std::nullopt;
    return kind == SignalKind::Buy ? initial * (1.0 + *r) : initial * (1.0 - *r);
}

double maxDrawdownPct(const std::vector<std::optional<double>>& curve) {
    double peak = 0;
    bool have_peak = false;
    double max_dd = 0;
    for (const auto& point : curve) {
        if (!point) continue;
        double eq = *point;
        if (!have_peak || eq > peak) {
            peak = eq;
            have_peak = true;
        }
        double dd = (peak > 0) ? (peak - eq) / peak * 100.0 : 0;
        if (dd > max_dd) max_dd = dd;
    }
    return max_dd;
}

} // namespace mabt
