#pragma once

#include "bar.hpp"
#include "params.hpp"
#include "signal.hpp"
#include <memory>
#include <string>

namespace stratbench {

class IContext;  // forward declaration

/// Signal rule of a strategy variant.
/// The engine calls onBar() for each bar in chronological order (no look-ahead) and decides
/// itself whether the returned signal is executed; strategies never touch the position.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    /// Variant name, e.g. "ma_crossover".
    virtual std::string name() const = 0;

    /// Parameters as text, e.g. "short=10 long=50".
    virtual std::string describeParams() const = 0;

    /// Called once before the first bar: fetch indicator series here.
    virtual void onStart(IContext& ctx) = 0;

    /// Signal for the current bar. Undefined indicator inputs must yield Signal::Hold.
    virtual Signal onBar(const Bar& bar, const IContext& ctx) const = 0;
};

enum class StrategyKind { MaCrossover, RsiReversal, TrendFilteredCrossover };

enum class TrendFilter { None, Atr, Adx, HigherTimeframe };

/// Which strategy to build. `filter` is only used by TrendFilteredCrossover.
struct StrategySpec {
    StrategyKind kind{StrategyKind::MaCrossover};
    TrendFilter filter{TrendFilter::None};
};

/// Build a strategy from a parameter set. Missing parameters take the strategy defaults.
/// Throws ConfigError for invalid values (non-positive periods, oversold >= overbought, ...).
std::unique_ptr<IStrategy> createStrategy(const StrategySpec& spec, const ParamSet& params);

/// Parse "ma_crossover", "rsi_reversal", "trend_atr", "trend_adx", "trend_htf".
/// Throws ConfigError for unknown names.
StrategySpec parseStrategySpec(const std::string& name);

std::string strategySpecName(const StrategySpec& spec);

} // namespace stratbench
