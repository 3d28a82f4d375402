#pragma once

#include <optional>
#include <vector>

namespace stratbench {

/// Indicator values aligned with bar indices. std::nullopt = not defined yet (warm-up)
/// or not defined at all (e.g. RSI of a flat market).
using IndicatorSeries = std::vector<std::optional<double>>;

/// Simple moving average of the trailing `period` values. Undefined for i < period-1.
IndicatorSeries sma(const std::vector<double>& values, int period);

/// Mean of the trailing `period` entries of a series; undefined unless all of them are defined.
IndicatorSeries rollingMean(const IndicatorSeries& series, int period);

/// RSI over rolling averages of gains and losses. The first bar has no prior close and
/// counts as a zero change, so values start at index period-1.
/// avg_loss == 0 with avg_gain > 0 gives 100; both zero gives undefined.
IndicatorSeries rsi(const std::vector<double>& closes, int period);

/// True range per bar. First bar: high - low.
std::vector<double> trueRange(const std::vector<double>& high,
                              const std::vector<double>& low,
                              const std::vector<double>& close);

/// Average true range: rolling mean of true range over `period`.
IndicatorSeries atr(const std::vector<double>& high,
                    const std::vector<double>& low,
                    const std::vector<double>& close,
                    int period);

/// Average directional index. DI values are 0 when smoothed TR is 0, DX is 0 when
/// +DI + -DI is 0, so a flat market yields 0 rather than NaN. Defined from index 2*period-2.
IndicatorSeries adx(const std::vector<double>& high,
                    const std::vector<double>& low,
                    const std::vector<double>& close,
                    int period);

/// SMA of a coarser timeframe built from buckets of `factor` consecutive bars.
/// At bar i only buckets completed at or before i are used (no look-ahead).
IndicatorSeries higherTimeframeSma(const std::vector<double>& closes, int factor, int period);

} // namespace stratbench
