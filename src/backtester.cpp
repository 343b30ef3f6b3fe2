#include "backtester.hpp"
#include "moving_average.hpp"
#include "normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <set>
#include <sstream>

namespace mabt {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void warn(std::vector<std::string>* warnings, const std::string& msg) {
    if (warnings) warnings->push_back(msg);
}

int clampWindow(int value, int lo, int hi, const char* name, std::vector<std::string>* warnings) {
    int clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        warn(warnings, std::string(name) + " " + std::to_string(value) + " outside ["
            + std::to_string(lo) + ", " + std::to_string(hi) + "], using " + std::to_string(clamped));
    }
    return clamped;
}

TickerOutcome unavailable(const std::string& ticker, const std::string& reason) {
    TickerOutcome out;
    out.ticker = ticker;
    out.unavailable_reason = reason;
    return out;
}

TickerOutcome runTicker(const BacktestConfig& config, const MarketDataProvider& provider,
                        const std::string& ticker) {
    FetchResult fetched = provider.fetch(ticker, config.start_date, config.end_date);
    SeriesResult normalized = normalizeSeries(ticker, fetched);
    if (!normalized.ok()) return unavailable(ticker, normalized.reason);

    TickerOutcome out;
    out.ticker = ticker;
    out.report = runBacktest(config, *normalized.series);
    return out;
}

} // namespace

std::vector<std::string> parseTickerList(const std::string& text) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    std::istringstream iss(text);
    std::string part;
    while (std::getline(iss, part, ',')) {
        std::string t = trim(part);
        for (auto& c : t) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (t.empty() || !seen.insert(t).second) continue;
        out.push_back(t);
    }
    return out;
}

BacktestConfig clampConfig(BacktestConfig config, std::vector<std::string>* warnings) {
    config.short_window = clampWindow(config.short_window, MIN_SHORT_WINDOW, MAX_SHORT_WINDOW,
                                      "short window", warnings);
    const bool level = config.policy.kind == PolicyKind::LevelCount;
    config.long_window = clampWindow(config.long_window, level ? MIN_LEVEL_WINDOW : MIN_LONG_WINDOW,
                                     MAX_LONG_WINDOW, level ? "MA window" : "long window", warnings);
    if (!level && config.short_window >= config.long_window) {
        warn(warnings, "short window " + std::to_string(config.short_window)
            + " is not below long window " + std::to_string(config.long_window)
            + "; crossovers are unlikely");
    }

    double invest = config.initial_investment;
    if (!std::isfinite(invest)) {
        warn(warnings, "initial investment is not a number, using " + std::to_string(MIN_INVESTMENT));
        config.initial_investment = MIN_INVESTMENT;
    } else if (invest < MIN_INVESTMENT || invest > MAX_INVESTMENT) {
        config.initial_investment = std::clamp(invest, MIN_INVESTMENT, MAX_INVESTMENT);
        std::ostringstream msg;
        msg << "initial investment " << invest << " outside [" << MIN_INVESTMENT << ", "
            << MAX_INVESTMENT << "], using " << config.initial_investment;
        warn(warnings, msg.str());
    }

    if (!std::isfinite(config.policy.theta) || config.policy.theta < 0) {
        if (config.policy.kind == PolicyKind::ThresholdGatedCrossover)
            warn(warnings, "touch threshold must be >= 0, using 0");
        config.policy.theta = 0;
    }

    std::string joined;
    for (const auto& t : config.tickers) joined += t + ",";
    config.tickers = parseTickerList(joined);
    return config;
}

TickerReport runBacktest(BacktestConfig config, const Series& series) {
    config = clampConfig(std::move(config));

    EngineSettings settings;
    settings.policy = config.policy;
    settings.accounting = config.accounting;
    settings.initial_capital = config.initial_investment;
    settings.short_window = config.short_window;
    settings.long_window = config.long_window;

    TickerReport report;
    report.ticker = series.ticker();
    report.series = series;
    report.run = SignalEngine(settings).run(series);
    report.history = buildSignalHistory(report.run.events);
    report.portfolio = makePortfolioResult(config.initial_investment, report.run.final_value);
    report.max_drawdown_pct = maxDrawdownPct(report.run.equity_curve);
    report.config = std::move(config);
    return report;
}

std::size_t BatchReport::successCount() const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const TickerOutcome& o) { return o.ok(); }));
}

BatchReport runBatch(BacktestConfig config, const MarketDataProvider& provider) {
    BatchReport batch;
    batch.config = clampConfig(std::move(config), &batch.warnings);
    const BacktestConfig& cfg = batch.config;

    // Deferred tasks run inside get(), i.e. sequentially in ticker order
    const auto policy = cfg.parallel ? std::launch::async : std::launch::deferred;
    std::vector<std::future<TickerOutcome>> futures;
    futures.reserve(cfg.tickers.size());
    for (const auto& ticker : cfg.tickers) {
        futures.push_back(std::async(policy, [&cfg, &provider, ticker]() {
            return runTicker(cfg, provider, ticker);
        }));
    }

    std::vector<PortfolioResult> results;
    for (std::size_t k = 0; k < futures.size(); ++k) {
        try {
            batch.outcomes.push_back(futures[k].get());
        } catch (const std::exception& e) {
            batch.outcomes.push_back(unavailable(cfg.tickers[k], std::string("error: ") + e.what()));
        }
        const TickerOutcome& outcome = batch.outcomes.back();
        if (outcome.ok()) results.push_back(outcome.report->portfolio);
    }

    batch.aggregate = aggregateResults(results);
    return batch;
}

} // namespace mabt
