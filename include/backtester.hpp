#pragma once

#include "bar.hpp"
#include "context.hpp"
#include "indicator_cache.hpp"
#include "metrics.hpp"
#include "params.hpp"
#include "position_tracker.hpp"
#include "strategy.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace stratbench {

/// Which part of the bar sequence a run covered.
enum class Split { Train, Test, Full };

inline const char* toString(Split s) {
    switch (s) {
        case Split::Train: return "train";
        case Split::Test: return "test";
        case Split::Full: return "full";
    }
    return "?";
}

/// Everything one run produced. Never mutated after Backtester::run() returns it.
struct SimulationResult {
    std::string variant;
    ParamSet params;
    std::string params_text;
    Split split{Split::Full};

    std::vector<Trade> trades;
    std::vector<double> equity_curve;   // starting capital, then equity after each bar
    double starting_capital{0};
    double final_cash{0};
    std::optional<Position> open_position;
    double last_close{0};
    std::size_t bars_processed{0};
    int skipped_buys{0};

    Metrics metrics;
};

/// Context handed to the strategy: current bar index, the window and its indicators.
class BacktestContext : public IContext {
public:
    BacktestContext(const std::vector<Bar>& bars, IndicatorCache& indicators);

    std::size_t barIndex() const override { return bar_index_; }
    const std::vector<Bar>& bars() const override { return bars_; }
    IndicatorCache& indicators() const override { return indicators_; }

    void setBarIndex(std::size_t i) { bar_index_ = i; }

private:
    const std::vector<Bar>& bars_;
    IndicatorCache& indicators_;
    std::size_t bar_index_{0};
};

/// Runs one strategy over one bar window.
/// Per bar: (1) when holding, the stop-loss is checked first and, if hit, exits and the
/// strategy is not consulted; (2) otherwise the strategy signal is applied through the
/// position tracker; (3) mark-to-market equity is recorded.
/// A position still open after the last bar is left open (see Metrics).
class Backtester {
public:
    Backtester(std::unique_ptr<IStrategy> strategy, const RiskConfig& risk);

    /// Simulate over `bars`. `cache` must have been built over the same bars; when null a
    /// private cache is used. `trace` receives one line per trade when set.
    SimulationResult run(const std::vector<Bar>& bars,
                         IndicatorCache* cache = nullptr,
                         std::ostream* trace = nullptr);

    const IStrategy& strategy() const { return *strategy_; }

private:
    std::unique_ptr<IStrategy> strategy_;
    RiskConfig risk_;
};

/// Convenience: build the strategy from (spec, params) and run it once.
SimulationResult runSimulation(const std::vector<Bar>& bars,
                               const StrategySpec& spec,
                               const ParamSet& params,
                               const RiskConfig& risk,
                               IndicatorCache* cache = nullptr);

} // namespace stratbench
