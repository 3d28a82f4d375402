#pragma once

#include <string>
#include <vector>

namespace stratbench {

/// Single OHLCV bar. Timestamps are ISO-8601 strings, so string order is time order.
struct Bar {
    std::string timestamp;  // e.g. "2024-01-02T13:00:00"
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};       // optional
};

using BarSeries = std::vector<Bar>;

} // namespace stratbench
