#pragma once

#include "strategy.hpp"
#include "ma_crossover_strategy.hpp"
#include <memory>

namespace stratbench {

/// MA crossover whose entries need trend confirmation. Exits are never filtered.
/// ATR:  ATR(atr_period) > mean(ATR, atr_ma_period) * atr_threshold
/// ADX:  ADX(adx_period) > adx_threshold
/// HTF:  SMA(htf_short) > SMA(htf_long) on buckets of htf_factor bars (e.g. 4 x 1h = 4h)
/// Undefined filter inputs mean "trend not confirmed".
struct TrendFilterParams {
    MaCrossoverParams ma{20, 50};
    TrendFilter filter{TrendFilter::Atr};

    int atr_period = 14;
    double atr_threshold = 1.0;
    int atr_ma_period = 20;

    int adx_period = 14;
    double adx_threshold = 25;

    int htf_factor = 4;
    int htf_short = 10;
    int htf_long = 20;

    /// Throws ConfigError for invalid periods/thresholds of the selected filter.
    void validate() const;
};

std::unique_ptr<IStrategy> createTrendFilterStrategy(const TrendFilterParams& params = TrendFilterParams{});

} // namespace stratbench
