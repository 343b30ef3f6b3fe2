#pragma once

#include <string>
#include <vector>

namespace mabt {

/// One provider row before coercion. Fields are kept as text; the normalizer
/// decides what parses.
struct RawBar {
    std::string date;
    std::string open;
    std::string high;
    std::string low;
    std::string close;
    std::string volume;
};

/// Provider answer: rows, or unavailable with a reason (lookup/IO failure).
struct FetchResult {
    bool ok{false};
    std::vector<RawBar> rows;
    std::string reason;

    static FetchResult success(std::vector<RawBar> rows);
    static FetchResult unavailable(std::string reason);
};

/// Source of daily bars for a ticker over an inclusive date range.
/// Implementations used with a parallel batch must allow concurrent fetch() calls.
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    virtual FetchResult fetch(const std::string& ticker,
                              const std::string& start_date,
                              const std::string& end_date) const = 0;
};

/// Loads daily bars from <dir>/<TICKER>.csv.
/// CSV: expected columns date/timestamp, open, high, low, close [, volume].
/// Rows outside [start_date, end_date] are dropped; rows whose date does not parse
/// are passed through unchanged so the normalizer can reject them.
class CsvDataSource : public MarketDataProvider {
public:
    explicit CsvDataSource(const std::string& dir);

    FetchResult fetch(const std::string& ticker,
                      const std::string& start_date,
                      const std::string& end_date) const override;

    /// Path tried first for a ticker.
    std::string pathFor(const std::string& ticker) const;

private:
    std::string dir_;
};

} // namespace mabt
