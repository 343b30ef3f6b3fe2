#include "normalizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace mabt {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\"");
    return s.substr(start, end - start + 1);
}

} // namespace

std::optional<double> parsePrice(const std::string& field) {
    std::string s = trim(field);
    if (s.empty()) return std::nullopt;
    double v = 0;
    try {
        std::size_t pos = 0;
        v = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

std::int64_t parseVolume(const std::string& field) {
    auto v = parsePrice(field);
    if (!v || *v < 0) return 0;
    if (*v >= static_cast<double>(std::numeric_limits<std::int64_t>::max()))
        return std::numeric_limits<std::int64_t>::max();
    return static_cast<std::int64_t>(*v);
}

SeriesResult normalizeSeries(const std::string& ticker, const std::vector<RawBar>& rows) {
    std::vector<Bar> bars;
    bars.reserve(rows.size());

    for (const RawBar& raw : rows) {
        auto date = normalizeDate(raw.date);
        if (!date) continue;
        auto o = parsePrice(raw.open);
        auto h = parsePrice(raw.high);
        auto l = parsePrice(raw.low);
        auto c = parsePrice(raw.close);
        if (!o || !h || !l || !c) continue;
        if (*o <= 0 || *h <= 0 || *l <= 0 || *c <= 0) continue;

        Bar b;
        b.date = *date;
        b.open = *o;
        b.high = *h;
        b.low = *l;
        b.close = *c;
        b.volume = parseVolume(raw.volume);
        bars.push_back(std::move(b));
    }

    // Stable so the first row wins among duplicate dates
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.date < b.date;
    });
    bars.erase(std::unique(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.date == b.date;
    }), bars.end());

    SeriesResult result;
    if (bars.empty()) {
        result.reason = "no data";
        return result;
    }
    result.series = Series(ticker, std::move(bars));
    return result;
}

SeriesResult normalizeSeries(const std::string& ticker, const FetchResult& fetched) {
    if (!fetched.ok) {
        SeriesResult result;
        result.reason = fetched.reason.empty() ? "provider unavailable" : fetched.reason;
        return result;
    }
    return normalizeSeries(ticker, fetched.rows);
}

} // namespace mabt
