#pragma once

#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mabt {

/// Single daily OHLCV bar.
struct Bar {
    std::string date;       // "YYYY-MM-DD"
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    std::int64_t volume{0};
};

/// Normalize a date field to "YYYY-MM-DD". Accepts a trailing time/zone part
/// ("2024-01-02 00:00:00-05:00", "2024-01-02T00:00"). Returns nullopt if the
/// leading date is missing or not a real calendar date.
std::optional<std::string> normalizeDate(const std::string& field);

/// Local calendar date of t as "YYYY-MM-DD"; nullopt if localtime() fails.
std::optional<std::string> localDate(std::time_t t);

/// iso plus `days` calendar days (negative goes back); nullopt on a bad date.
std::optional<std::string> shiftDate(const std::string& iso, int days);

/// Ordered daily bars for one ticker, indexed by position.
/// Bars are strictly increasing in date (the normalizer guarantees it).
class Series {
public:
    Series() = default;
    Series(std::string ticker, std::vector<Bar> bars);

    const std::string& ticker() const { return ticker_; }
    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    const Bar& at(std::size_t i) const { return bars_.at(i); }
    const Bar& back() const { return bars_.back(); }

    /// Position of the bar with this date, if present.
    std::optional<std::size_t> indexOf(const std::string& date) const;

    std::vector<double> closes() const;

private:
    std::string ticker_;
    std::vector<Bar> bars_;
    std::map<std::string, std::size_t> index_by_date_;
};

} // namespace mabt
