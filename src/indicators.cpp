#include "indicators.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace stratbench {

namespace {

void requirePositive(int value, const char* what) {
    if (value <= 0)
        throw ConfigError(std::string(what) + " must be > 0 (got " + std::to_string(value) + ")");
}

// Trailing-window mean over a plain vector; window sums are recomputed per index
// so results do not drift with long series.
IndicatorSeries windowMean(const std::vector<double>& values, int period) {
    IndicatorSeries out(values.size());
    const std::size_t p = static_cast<std::size_t>(period);
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i + 1 < p) continue;
        double sum = 0;
        for (std::size_t k = i + 1 - p; k <= i; ++k)
            sum += values[k];
        out[i] = sum / period;
    }
    return out;
}

} // namespace

IndicatorSeries sma(const std::vector<double>& values, int period) {
    requirePositive(period, "SMA period");
    return windowMean(values, period);
}

IndicatorSeries rollingMean(const IndicatorSeries& series, int period) {
    requirePositive(period, "rolling mean period");
    IndicatorSeries out(series.size());
    const std::size_t p = static_cast<std::size_t>(period);
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (i + 1 < p) continue;
        double sum = 0;
        bool complete = true;
        for (std::size_t k = i + 1 - p; k <= i; ++k) {
            if (!series[k]) { complete = false; break; }
            sum += *series[k];
        }
        if (complete) out[i] = sum / period;
    }
    return out;
}

IndicatorSeries rsi(const std::vector<double>& closes, int period) {
    requirePositive(period, "RSI period");
    const std::size_t n = closes.size();
    std::vector<double> gains(n, 0.0), losses(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        double delta = closes[i] - closes[i - 1];
        if (delta > 0) gains[i] = delta;
        else if (delta < 0) losses[i] = -delta;
    }
    IndicatorSeries avg_gain = windowMean(gains, period);
    IndicatorSeries avg_loss = windowMean(losses, period);

    IndicatorSeries out(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (!avg_gain[i] || !avg_loss[i]) continue;
        double g = *avg_gain[i];
        double l = *avg_loss[i];
        if (l == 0) {
            if (g > 0) out[i] = 100.0;
            continue;  // no movement at all: nothing to rate
        }
        double rs = g / l;
        out[i] = 100.0 - 100.0 / (1.0 + rs);
    }
    return out;
}

std::vector<double> trueRange(const std::vector<double>& high,
                              const std::vector<double>& low,
                              const std::vector<double>& close) {
    const std::size_t n = std::min({high.size(), low.size(), close.size()});
    std::vector<double> tr(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        double range = high[i] - low[i];
        if (i == 0) {
            tr[i] = range;
            continue;
        }
        double prev_close = close[i - 1];
        tr[i] = std::max({range, std::abs(high[i] - prev_close), std::abs(low[i] - prev_close)});
    }
    return tr;
}

IndicatorSeries atr(const std::vector<double>& high,
                    const std::vector<double>& low,
                    const std::vector<double>& close,
                    int period) {
    requirePositive(period, "ATR period");
    return windowMean(trueRange(high, low, close), period);
}

IndicatorSeries adx(const std::vector<double>& high,
                    const std::vector<double>& low,
                    const std::vector<double>& close,
                    int period) {
    requirePositive(period, "ADX period");
    std::vector<double> tr = trueRange(high, low, close);
    const std::size_t n = tr.size();

    std::vector<double> plus_dm(n, 0.0), minus_dm(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        double up = high[i] - high[i - 1];
        double down = low[i - 1] - low[i];
        if (up > down && up > 0) plus_dm[i] = up;
        if (down > up && down > 0) minus_dm[i] = down;
    }

    IndicatorSeries smoothed_tr = windowMean(tr, period);
    IndicatorSeries smoothed_plus = windowMean(plus_dm, period);
    IndicatorSeries smoothed_minus = windowMean(minus_dm, period);

    IndicatorSeries dx(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (!smoothed_tr[i]) continue;
        double plus_di = 0, minus_di = 0;
        if (*smoothed_tr[i] > 0) {
            plus_di = 100.0 * *smoothed_plus[i] / *smoothed_tr[i];
            minus_di = 100.0 * *smoothed_minus[i] / *smoothed_tr[i];
        }
        double di_sum = plus_di + minus_di;
        dx[i] = (di_sum > 0) ? 100.0 * std::abs(plus_di - minus_di) / di_sum : 0.0;
    }
    return rollingMean(dx, period);
}

IndicatorSeries higherTimeframeSma(const std::vector<double>& closes, int factor, int period) {
    requirePositive(factor, "higher timeframe factor");
    requirePositive(period, "higher timeframe SMA period");
    const std::size_t f = static_cast<std::size_t>(factor);
    const std::size_t p = static_cast<std::size_t>(period);

    IndicatorSeries out(closes.size());
    for (std::size_t i = 0; i < closes.size(); ++i) {
        std::size_t completed = (i + 1) / f;
        if (completed < p) continue;
        double sum = 0;
        for (std::size_t b = completed - p; b < completed; ++b)
            sum += closes[(b + 1) * f - 1];
        out[i] = sum / period;
    }
    return out;
}

} // namespace stratbench
