#include "data_source.hpp"
#include "bar.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mabt {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    // "a,b," has an empty trailing field that getline drops
    if (!line.empty() && line.back() == delim) parts.emplace_back();
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

std::string field(const std::vector<std::string>& parts, int index) {
    if (index < 0 || static_cast<std::size_t>(index) >= parts.size()) return "";
    return parts[static_cast<std::size_t>(index)];
}

} // namespace

FetchResult FetchResult::success(std::vector<RawBar> rows) {
    FetchResult r;
    r.ok = true;
    r.rows = std::move(rows);
    return r;
}

FetchResult FetchResult::unavailable(std::string reason) {
    FetchResult r;
    r.ok = false;
    r.reason = std::move(reason);
    return r;
}

CsvDataSource::CsvDataSource(const std::string& dir) : dir_(dir) {}

std::string CsvDataSource::pathFor(const std::string& ticker) const {
    return (fs::path(dir_) / (ticker + ".csv")).string();
}

FetchResult CsvDataSource::fetch(const std::string& ticker,
                                 const std::string& start_date,
                                 const std::string& end_date) const {
    std::string path = pathFor(ticker);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        std::string lower = ticker;
        toLower(lower);
        std::string alt = (fs::path(dir_) / (lower + ".csv")).string();
        if (!fs::is_regular_file(alt, ec))
            return FetchResult::unavailable("no data file for " + ticker + " in " + dir_);
        path = alt;
    }

    std::ifstream f(path);
    if (!f.is_open()) return FetchResult::unavailable("cannot open " + path);

    std::string line;
    if (!std::getline(f, line)) return FetchResult::unavailable("empty file " + path);
    // Strip UTF-8 BOM if present
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    int iDate = findColumn(headers, {"date", "timestamp", "datetime", "time"});
    int iOpen = findColumn(headers, {"open", "o"});
    int iHigh = findColumn(headers, {"high", "h"});
    int iLow = findColumn(headers, {"low", "l"});
    int iClose = findColumn(headers, {"close", "c"});
    int iVol = findColumn(headers, {"volume", "vol", "v"});

    if (iDate < 0 || iOpen < 0 || iHigh < 0 || iLow < 0 || iClose < 0)
        return FetchResult::unavailable("missing columns in " + path + " (need date, open, high, low, close)");

    std::vector<RawBar> rows;
    while (std::getline(f, line)) {
        if (trim(line).empty()) continue;
        auto parts = split(line, ',');

        RawBar raw;
        raw.date = field(parts, iDate);
        raw.open = field(parts, iOpen);
        raw.high = field(parts, iHigh);
        raw.low = field(parts, iLow);
        raw.close = field(parts, iClose);
        raw.volume = field(parts, iVol);

        auto date = normalizeDate(raw.date);
        if (date && (*date < start_date || *date > end_date)) continue;
        rows.push_back(std::move(raw));
    }
    if (f.bad()) return FetchResult::unavailable("read error in " + path);

    return FetchResult::success(std::move(rows));
}

} // namespace mabt
