#include "data_source.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <map>

namespace stratbench {

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

// Parse timestamp to (year, month, day, hour, minute). Returns false if unparseable.
// Supports: "2024-01-02", "2024-01-02T12:30:00", "2024-01-02 12:30:00"
bool parseTimestamp(const std::string& ts, int& year, int& month, int& day, int& hour, int& minute) {
    year = month = day = hour = minute = 0;
    std::string datePart, timePart;
    auto tPos = ts.find('T');
    auto spPos = ts.find(' ');
    if (tPos != std::string::npos) {
        datePart = ts.substr(0, tPos);
        timePart = ts.substr(tPos + 1);
    } else if (spPos != std::string::npos) {
        datePart = ts.substr(0, spPos);
        timePart = ts.substr(spPos + 1);
    } else {
        datePart = ts;
    }
    // Date YYYY-MM-DD
    if (datePart.size() < 10) return false;
    try {
        year = std::stoi(datePart.substr(0, 4));
        month = std::stoi(datePart.substr(5, 2));
        day = std::stoi(datePart.substr(8, 2));
    } catch (const std::exception&) {
        return false;
    }
    if (!timePart.empty()) {
        auto colon1 = timePart.find(':');
        if (colon1 != std::string::npos) {
            try {
                hour = std::stoi(timePart.substr(0, colon1));
                minute = std::stoi(timePart.substr(colon1 + 1, 2));
            } catch (const std::exception&) {
                return false;
            }
        }
    }
    return true;
}

// Period key for grouping: "YYYY-MM-DDTHH:MM" truncated to the interval start.
std::string periodKey(int year, int month, int day, int hour, int minute, int intervalMinutes) {
    int minuteOfDay = hour * 60 + minute;
    int start = (intervalMinutes >= 1440) ? 0 : (minuteOfDay / intervalMinutes) * intervalMinutes;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d", year, month, day, start / 60, start % 60);
    return std::string(buf);
}

int intervalFor(const std::string& resolution) {
    if (resolution == "15m") return 15;
    if (resolution == "1h" || resolution == "1hr") return 60;
    if (resolution == "4h") return 240;
    if (resolution == "1d") return 1440;
    return -1;
}

} // namespace

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::load() {
    bars_.clear();
    skipped_rows_ = 0;
    std::ifstream f(filepath_);
    if (!f.is_open()) return false;

    std::string line;
    if (!std::getline(f, line)) return false;
    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    int iDate = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    int iOpen = findColumn(headers, {"open", "o"});
    int iHigh = findColumn(headers, {"high", "h"});
    int iLow = findColumn(headers, {"low", "l"});
    int iClose = findColumn(headers, {"close", "c"});

    if (iDate < 0 || iOpen < 0 || iHigh < 0 || iLow < 0 || iClose < 0)
        return false;

    while (std::getline(f, line)) {
        if (trim(line).empty()) continue;
        auto bar = parseLine(line, headers);
        if (!bar) {
            ++skipped_rows_;
            continue;
        }
        bars_.push_back(*bar);
    }

    std::stable_sort(bars_.begin(), bars_.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });
    auto last = std::unique(bars_.begin(), bars_.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp == b.timestamp;
    });
    skipped_rows_ += static_cast<std::size_t>(std::distance(last, bars_.end()));
    bars_.erase(last, bars_.end());
    return true;
}

bool DataSource::aggregateBars(const std::string& resolution) {
    std::string r = resolution;
    toLower(r);
    if (r == "1m" || r.empty()) return true;
    int intervalMinutes = intervalFor(r);
    if (intervalMinutes < 0) return false;

    std::map<std::string, Bar> keyToBar;
    for (const Bar& b : bars_) {
        int y, mo, d, h, mi;
        if (!parseTimestamp(b.timestamp, y, mo, d, h, mi)) continue;
        std::string key = periodKey(y, mo, d, h, mi, intervalMinutes);
        auto it = keyToBar.find(key);
        if (it == keyToBar.end()) {
            Bar agg = b;
            agg.timestamp = key;
            keyToBar[key] = agg;
        } else {
            Bar& agg = it->second;
            if (b.high > agg.high) agg.high = b.high;
            if (b.low < agg.low) agg.low = b.low;
            agg.close = b.close;
            agg.volume += b.volume;
        }
    }
    bars_.clear();
    for (const auto& p : keyToBar)
        bars_.push_back(p.second);
    return true;
}

std::optional<Bar> DataSource::parseLine(const std::string& line,
                                          const std::vector<std::string>& headers) {
    auto parts = split(line, ',');
    if (parts.size() < 5) return std::nullopt;

    int iDate = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    int iOpen = findColumn(headers, {"open", "o"});
    int iHigh = findColumn(headers, {"high", "h"});
    int iLow = findColumn(headers, {"low", "l"});
    int iClose = findColumn(headers, {"close", "c"});
    int iVol = findColumn(headers, {"volume", "vol", "v"});

    const int maxCol = std::max({iDate, iOpen, iHigh, iLow, iClose});
    if (static_cast<std::size_t>(maxCol) >= parts.size()) return std::nullopt;

    Bar b;
    b.timestamp = parts[static_cast<std::size_t>(iDate)];
    if (b.timestamp.empty()) return std::nullopt;
    try {
        b.open = std::stod(parts[static_cast<std::size_t>(iOpen)]);
        b.high = std::stod(parts[static_cast<std::size_t>(iHigh)]);
        b.low = std::stod(parts[static_cast<std::size_t>(iLow)]);
        b.close = std::stod(parts[static_cast<std::size_t>(iClose)]);
        if (iVol >= 0 && static_cast<std::size_t>(iVol) < parts.size())
            b.volume = std::stod(parts[static_cast<std::size_t>(iVol)]);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (b.open <= 0 || b.high <= 0 || b.low <= 0 || b.close <= 0 || b.volume < 0)
        return std::nullopt;
    return b;
}

} // namespace stratbench
