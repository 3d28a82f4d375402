#include "strategy.hpp"
#include "errors.hpp"
#include "ma_crossover_strategy.hpp"
#include "rsi_reversal_strategy.hpp"
#include "trend_filter_strategy.hpp"
#include <cmath>
#include <limits>

namespace stratbench {

namespace {

// Periods arrive as doubles from the grid; only whole positive numbers are accepted.
int periodParam(const ParamSet& params, const char* name, int fallback) {
    double v = params.get(name, fallback);
    if (std::floor(v) != v || v <= 0 || v > std::numeric_limits<int>::max())
        throw ConfigError(std::string("parameter '") + name + "' must be a positive integer (got " +
                          formatParamValue(v) + ")");
    return static_cast<int>(v);
}

MaCrossoverParams maParams(const ParamSet& params, const MaCrossoverParams& defaults) {
    MaCrossoverParams p;
    p.short_period = periodParam(params, "short", defaults.short_period);
    p.long_period = periodParam(params, "long", defaults.long_period);
    return p;
}

} // namespace

std::unique_ptr<IStrategy> createStrategy(const StrategySpec& spec, const ParamSet& params) {
    switch (spec.kind) {
        case StrategyKind::MaCrossover:
            return createMaCrossoverStrategy(maParams(params, MaCrossoverParams{}));

        case StrategyKind::RsiReversal: {
            RsiReversalParams p;
            p.period = periodParam(params, "period", p.period);
            p.oversold = params.get("oversold", p.oversold);
            p.overbought = params.get("overbought", p.overbought);
            return createRsiReversalStrategy(p);
        }

        case StrategyKind::TrendFilteredCrossover: {
            TrendFilterParams p;
            p.filter = spec.filter;
            p.ma = maParams(params, p.ma);
            p.atr_period = periodParam(params, "atr_period", p.atr_period);
            p.atr_threshold = params.get("atr_threshold", p.atr_threshold);
            p.atr_ma_period = periodParam(params, "atr_ma_period", p.atr_ma_period);
            p.adx_period = periodParam(params, "adx_period", p.adx_period);
            p.adx_threshold = params.get("adx_threshold", p.adx_threshold);
            p.htf_factor = periodParam(params, "htf_factor", p.htf_factor);
            p.htf_short = periodParam(params, "htf_short", p.htf_short);
            p.htf_long = periodParam(params, "htf_long", p.htf_long);
            return createTrendFilterStrategy(p);
        }
    }
    throw ConfigError("unknown strategy kind");
}

StrategySpec parseStrategySpec(const std::string& name) {
    if (name == "ma_crossover") return {StrategyKind::MaCrossover, TrendFilter::None};
    if (name == "rsi_reversal") return {StrategyKind::RsiReversal, TrendFilter::None};
    if (name == "trend_atr") return {StrategyKind::TrendFilteredCrossover, TrendFilter::Atr};
    if (name == "trend_adx") return {StrategyKind::TrendFilteredCrossover, TrendFilter::Adx};
    if (name == "trend_htf") return {StrategyKind::TrendFilteredCrossover, TrendFilter::HigherTimeframe};
    throw ConfigError("unknown strategy: " + name);
}

std::string strategySpecName(const StrategySpec& spec) {
    switch (spec.kind) {
        case StrategyKind::MaCrossover: return "ma_crossover";
        case StrategyKind::RsiReversal: return "rsi_reversal";
        case StrategyKind::TrendFilteredCrossover:
            switch (spec.filter) {
                case TrendFilter::Atr: return "trend_atr";
                case TrendFilter::Adx: return "trend_adx";
                case TrendFilter::HigherTimeframe: return "trend_htf";
                case TrendFilter::None: break;
            }
            return "trend";
    }
    return "unknown";
}

} // namespace stratbench
