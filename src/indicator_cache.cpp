#include "indicator_cache.hpp"

namespace stratbench {

IndicatorCache::IndicatorCache(const std::vector<Bar>& bars) : bars_(bars) {
    highs_.reserve(bars.size());
    lows_.reserve(bars.size());
    closes_.reserve(bars.size());
    for (const Bar& b : bars) {
        highs_.push_back(b.high);
        lows_.push_back(b.low);
        closes_.push_back(b.close);
    }
}

std::size_t IndicatorCache::size() const { return bars_.size(); }

IndicatorCache::SeriesPtr IndicatorCache::getOrCompute(const Key& key,
                                                       const std::function<IndicatorSeries()>& compute) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = series_.find(key);
        if (it != series_.end()) return it->second;
    }
    // Compute outside the lock; if another thread got there first keep its copy.
    auto computed = std::make_shared<const IndicatorSeries>(compute());
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = series_.emplace(key, computed);
    return inserted.first->second;
}

IndicatorCache::SeriesPtr IndicatorCache::sma(int period) {
    return getOrCompute({IndicatorKind::Sma, period, 0},
                        [&] { return stratbench::sma(closes_, period); });
}

IndicatorCache::SeriesPtr IndicatorCache::rsi(int period) {
    return getOrCompute({IndicatorKind::Rsi, period, 0},
                        [&] { return stratbench::rsi(closes_, period); });
}

IndicatorCache::SeriesPtr IndicatorCache::atr(int period) {
    return getOrCompute({IndicatorKind::Atr, period, 0},
                        [&] { return stratbench::atr(highs_, lows_, closes_, period); });
}

IndicatorCache::SeriesPtr IndicatorCache::atrMean(int atr_period, int avg_period) {
    return getOrCompute({IndicatorKind::AtrMean, atr_period, avg_period}, [&] {
        SeriesPtr base = atr(atr_period);
        return rollingMean(*base, avg_period);
    });
}

IndicatorCache::SeriesPtr IndicatorCache::adx(int period) {
    return getOrCompute({IndicatorKind::Adx, period, 0},
                        [&] { return stratbench::adx(highs_, lows_, closes_, period); });
}

IndicatorCache::SeriesPtr IndicatorCache::higherTimeframeSma(int factor, int period) {
    return getOrCompute({IndicatorKind::HigherTimeframeSma, period, factor},
                        [&] { return stratbench::higherTimeframeSma(closes_, factor, period); });
}

} // namespace stratbench
