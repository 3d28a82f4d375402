#pragma once

#include "bar.hpp"
#include "indicators.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <tuple>
#include <vector>

namespace stratbench {

enum class IndicatorKind { Sma, Rsi, Atr, AtrMean, Adx, HigherTimeframeSma };

/// Lazily computed indicator series for one bar window.
/// Keyed by (kind, period, aux); the window itself is fixed at construction, so one cache
/// instance corresponds to one bar range. Entries are never replaced or invalidated.
/// Safe to share between threads: lookups and inserts are serialized, series are immutable.
class IndicatorCache {
public:
    using SeriesPtr = std::shared_ptr<const IndicatorSeries>;

    explicit IndicatorCache(const std::vector<Bar>& bars);

    IndicatorCache(const IndicatorCache&) = delete;
    IndicatorCache& operator=(const IndicatorCache&) = delete;

    SeriesPtr sma(int period);
    SeriesPtr rsi(int period);
    SeriesPtr atr(int period);
    /// Rolling mean of ATR(atr_period) over avg_period bars.
    SeriesPtr atrMean(int atr_period, int avg_period);
    SeriesPtr adx(int period);
    SeriesPtr higherTimeframeSma(int factor, int period);

    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const;

private:
    struct Key {
        IndicatorKind kind;
        int period;
        int aux;
        bool operator<(const Key& o) const {
            return std::tie(kind, period, aux) < std::tie(o.kind, o.period, o.aux);
        }
    };

    SeriesPtr getOrCompute(const Key& key, const std::function<IndicatorSeries()>& compute);

    const std::vector<Bar>& bars_;
    std::vector<double> highs_;
    std::vector<double> lows_;
    std::vector<double> closes_;

    std::mutex mutex_;
    std::map<Key, SeriesPtr> series_;
};

} // namespace stratbench
