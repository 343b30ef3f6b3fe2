#include "bar.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace mabt {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return DAYS[month - 1];
}

bool allDigits(const std::string& s, std::size_t pos, std::size_t len) {
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

std::string formatDate(const std::tm& tm) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return buf;
}

} // namespace

std::optional<std::string> normalizeDate(const std::string& field) {
    auto start = field.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return std::nullopt;
    std::string s = field.substr(start);
    if (s.size() < 10) return std::nullopt;
    if (!allDigits(s, 0, 4) || s[4] != '-' || !allDigits(s, 5, 2) || s[7] != '-' || !allDigits(s, 8, 2))
        return std::nullopt;
    // Anything after the day must be a separator (time or zone suffix follows).
    if (s.size() > 10 && std::isdigit(static_cast<unsigned char>(s[10]))) return std::nullopt;

    int year = std::stoi(s.substr(0, 4));
    int month = std::stoi(s.substr(5, 2));
    int day = std::stoi(s.substr(8, 2));
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

std::optional<std::string> localDate(std::time_t t) {
    const std::tm* tm = std::localtime(&t);
    if (!tm) return std::nullopt;
    return formatDate(*tm);
}

std::optional<std::string> shiftDate(const std::string& iso, int days) {
    auto date = normalizeDate(iso);
    if (!date) return std::nullopt;
    std::tm tm{};
    tm.tm_year = std::stoi(date->substr(0, 4)) - 1900;
    tm.tm_mon = std::stoi(date->substr(5, 2)) - 1;
    tm.tm_mday = std::stoi(date->substr(8, 2)) + days;
    tm.tm_hour = 12;  // away from DST edges
    tm.tm_isdst = -1;
    if (std::mktime(&tm) == static_cast<std::time_t>(-1)) return std::nullopt;
    return formatDate(tm);
}

Series::Series(std::string ticker, std::vector<Bar> bars)
    : ticker_(std::move(ticker)), bars_(std::move(bars)) {
    for (std::size_t i = 0; i < bars_.size(); ++i)
        index_by_date_.emplace(bars_[i].date, i);
}

std::optional<std::size_t> Series::indexOf(const std::string& date) const {
    auto it = index_by_date_.find(date);
    if (it == index_by_date_.end()) return std::nullopt;
    return it->second;
}

std::vector<double> Series::closes() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const Bar& b : bars_) out.push_back(b.close);
    return out;
}

} // namespace mabt
