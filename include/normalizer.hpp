#pragma once

#include "bar.hpp"
#include "data_source.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mabt {

/// Normalized series, or the reason the ticker has no usable data.
struct SeriesResult {
    std::optional<Series> series;
    std::string reason;

    bool ok() const { return series.has_value(); }
};

/// Coerce raw rows into a Series ordered by date ascending.
/// Rows with an invalid date or an unparsable/non-finite/non-positive price are dropped.
/// Volume that does not parse (or is negative) becomes 0. Duplicate dates keep the first row.
/// An empty result is reported as "no data".
SeriesResult normalizeSeries(const std::string& ticker, const std::vector<RawBar>& rows);

/// Provider result straight to SeriesResult (unavailable reason carried over).
SeriesResult normalizeSeries(const std::string& ticker, const FetchResult& fetched);

/// Strict double parse: whole field must be consumed and the value finite.
std::optional<double> parsePrice(const std::string& field);

/// Volume parse: unparsable, negative or non-finite -> 0, fractional part truncated.
std::int64_t parseVolume(const std::string& field);

} // namespace mabt
