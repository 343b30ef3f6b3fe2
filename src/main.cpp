#include "backtester.hpp"
#include "data_source.hpp"
#include "report.hpp"
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int DEFAULT_SHORT_WINDOW = 20;
constexpr int DEFAULT_LONG_WINDOW = 50;
constexpr int DEFAULT_LOOKBACK_DAYS = 365;

//-----------------------------------------------------------------------------
// CliOptions: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct CliOptions {
    std::string data_dir = "data";
    std::string tickers = "AAPL";
    std::string start_date;   // default: end - 365 days
    std::string end_date;     // default: today
    std::string reports_dir = "reports";
    std::string policy = "crossover";
    std::string accounting = "mtm";
    double initial_investment = 10000.0;
    double theta = 0.001;
    int short_window = DEFAULT_SHORT_WINDOW;
    int long_window = DEFAULT_LONG_WINDOW;
    bool sequential = false;
    bool help = false;
};

void printUsage(std::ostream& out) {
    out << "Usage: ma_backtest [options]\n"
        << "  --data-dir DIR        directory with <TICKER>.csv files (default: data)\n"
        << "  --tickers LIST        comma-separated tickers (default: AAPL)\n"
        << "  --start YYYY-MM-DD    first date (default: end minus 365 days)\n"
        << "  --end YYYY-MM-DD      last date (default: today)\n"
        << "  --short N             short MA window, 5-100 (default: 20)\n"
        << "  --long N              long MA window, 20-200; 5-200 for level (default: 50)\n"
        << "  --cash X              initial investment per ticker, 100-1000000 (default: 10000)\n"
        << "  --policy NAME         level | crossover | gated (default: crossover)\n"
        << "  --theta X             touch threshold for gated (default: 0.001)\n"
        << "  --accounting NAME     mtm | realized (default: mtm)\n"
        << "  --reports-dir DIR     output directory (default: reports)\n"
        << "  --sequential          run tickers one after another\n";
}

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], CliOptions& opts, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 < argc) return argv[++i];
            error_msg = "Missing value for " + arg;
            return nullptr;
        };

        if (arg == "--help" || arg == "-h") { opts.help = true; }
        else if (arg == "--sequential") { opts.sequential = true; }
        else if (arg == "--data-dir") { const char* v = next(); if (!v) return false; opts.data_dir = v; }
        else if (arg == "--tickers") { const char* v = next(); if (!v) return false; opts.tickers = v; }
        else if (arg == "--start") { const char* v = next(); if (!v) return false; opts.start_date = v; }
        else if (arg == "--end") { const char* v = next(); if (!v) return false; opts.end_date = v; }
        else if (arg == "--reports-dir") { const char* v = next(); if (!v) return false; opts.reports_dir = v; }
        else if (arg == "--policy") { const char* v = next(); if (!v) return false; opts.policy = v; }
        else if (arg == "--accounting") { const char* v = next(); if (!v) return false; opts.accounting = v; }
        else if (arg == "--cash") { const char* v = next(); if (!v || !parseDouble(v, opts.initial_investment, error_msg, "--cash")) return false; }
        else if (arg == "--theta") { const char* v = next(); if (!v || !parseDouble(v, opts.theta, error_msg, "--theta")) return false; }
        else if (arg == "--short") { const char* v = next(); if (!v || !parseInt(v, opts.short_window, error_msg, "--short")) return false; }
        else if (arg == "--long") { const char* v = next(); if (!v || !parseInt(v, opts.long_window, error_msg, "--long")) return false; }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if options are invalid; fills cfg otherwise.
bool buildConfig(const CliOptions& opts, mabt::BacktestConfig& cfg, std::string& error_msg) {
    using namespace mabt;

    cfg.tickers = parseTickerList(opts.tickers);
    if (cfg.tickers.empty()) { error_msg = "--tickers must name at least one ticker"; return false; }

    if (opts.end_date.empty()) {
        auto today = localDate(std::time(nullptr));
        if (!today) { error_msg = "Cannot determine today's date; pass --end YYYY-MM-DD"; return false; }
        cfg.end_date = *today;
    } else {
        auto end = normalizeDate(opts.end_date);
        if (!end) { error_msg = "Invalid --end date: \"" + opts.end_date + "\" (expected YYYY-MM-DD)"; return false; }
        cfg.end_date = *end;
    }
    if (opts.start_date.empty()) {
        auto start = shiftDate(cfg.end_date, -DEFAULT_LOOKBACK_DAYS);
        if (!start) { error_msg = "Cannot compute default --start from " + cfg.end_date; return false; }
        cfg.start_date = *start;
    } else {
        auto start = normalizeDate(opts.start_date);
        if (!start) { error_msg = "Invalid --start date: \"" + opts.start_date + "\" (expected YYYY-MM-DD)"; return false; }
        cfg.start_date = *start;
    }
    if (cfg.start_date > cfg.end_date) { error_msg = "--start must not be after --end"; return false; }

    if (opts.policy == "level") cfg.policy = SignalPolicy::levelCount();
    else if (opts.policy == "crossover") cfg.policy = SignalPolicy::plainCrossover();
    else if (opts.policy == "gated") cfg.policy = SignalPolicy::thresholdGated(opts.theta);
    else { error_msg = "Unknown policy: " + opts.policy + " (available: level, crossover, gated)"; return false; }
    if (opts.theta < 0) { error_msg = "--theta must be >= 0"; return false; }

    if (opts.accounting == "mtm") cfg.accounting = Accounting::MarkToMarket;
    else if (opts.accounting == "realized") cfg.accounting = Accounting::RealizedAtExit;
    else { error_msg = "Unknown accounting: " + opts.accounting + " (available: mtm, realized)"; return false; }

    cfg.short_window = opts.short_window;
    cfg.long_window = opts.long_window;
    cfg.initial_investment = opts.initial_investment;
    cfg.parallel = !opts.sequential;
    return true;
}

//-----------------------------------------------------------------------------
// Per-ticker files: signals, trades, equity curve, chart session
//-----------------------------------------------------------------------------
void writeTickerReports(const mabt::TickerReport& tr, const std::string& reports_dir) {
    using namespace mabt;
    fs::path dir = fs::path(reports_dir) / tr.ticker;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << dir.string() << ": " << ec.message() << "\n";
        return;
    }
    Report report(tr);
    report.writeSignalHistory((dir / "signals.csv").string());
    report.writeTradeLog((dir / "trades.csv").string());
    report.writeEquityCurve((dir / "equity_curve.csv").string());
    report.writeSessionJson((dir / "session.json").string());
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    using namespace mabt;

    CliOptions opts;
    std::string error_msg;
    if (!parseArgs(argc, argv, opts, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (opts.help) {
        printUsage(std::cout);
        return 0;
    }

    BacktestConfig cfg;
    if (!buildConfig(opts, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    // Resolve default data dir when running from build/
    if (!fs::is_directory(opts.data_dir) && opts.data_dir == "data" && fs::is_directory("../data"))
        opts.data_dir = "../data";

    CsvDataSource provider(opts.data_dir);
    BatchReport batch = runBatch(cfg, provider);

    for (const auto& w : batch.warnings)
        std::cerr << "Warning: " << w << "\n";

    std::error_code ec;
    fs::create_directories(opts.reports_dir, ec);
    if (ec) std::cerr << "Cannot create " << opts.reports_dir << ": " << ec.message() << "\n";
    for (const auto& outcome : batch.outcomes) {
        if (!outcome.ok()) {
            std::cerr << "Skipped " << outcome.ticker << ": " << outcome.unavailable_reason << "\n";
            continue;
        }
        Report(*outcome.report).printSummary(std::cout);
        writeTickerReports(*outcome.report, opts.reports_dir);
    }

    printBatchSummary(batch, std::cout);
    std::string summary_path = (fs::path(opts.reports_dir) / "summary.txt").string();
    if (writeBatchSummary(batch, summary_path))
        std::cout << "Reports written to " << opts.reports_dir << "/\n";

    if (batch.successCount() == 0) {
        std::cerr << "All tickers skipped (no data or load failed).\n";
        return 1;
    }
    return 0;
}
