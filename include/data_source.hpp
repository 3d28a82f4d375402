#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <optional>

namespace stratbench {

/// Loads OHLCV bars from a CSV file.
/// CSV: expected columns timestamp/date/datetime, open, high, low, close [, volume].
/// Rows that do not parse or carry non-positive prices are skipped. Bars are sorted by
/// timestamp and duplicate timestamps keep their first row.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from the CSV file. Returns false if the file or its header is unusable.
    bool load();

    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    /// Get bar at index (0-based).
    const Bar& at(std::size_t i) const { return bars_.at(i); }

    /// Number of rows dropped by the last load() (unparseable, invalid or duplicate).
    std::size_t skippedRows() const { return skipped_rows_; }

    /// Aggregate bars into a coarser resolution: "15m", "1h" (or "1hr"), "4h", "1d".
    /// "1m" or empty = no-op. Returns false for an unknown resolution.
    /// OHLCV: open=first, high=max, low=min, close=last, volume=sum.
    bool aggregateBars(const std::string& resolution);

private:
    std::string filepath_;
    std::vector<Bar> bars_;
    std::size_t skipped_rows_{0};

    std::optional<Bar> parseLine(const std::string& line,
                                 const std::vector<std::string>& headers);
};

} // namespace stratbench
