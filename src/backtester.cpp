#include "backtester.hpp"
#include "errors.hpp"

namespace stratbench {

BacktestContext::BacktestContext(const std::vector<Bar>& bars, IndicatorCache& indicators)
    : bars_(bars), indicators_(indicators) {}

Backtester::Backtester(std::unique_ptr<IStrategy> strategy, const RiskConfig& risk)
    : strategy_(std::move(strategy))
    , risk_(risk)
{
    if (!strategy_) throw ConfigError("backtester needs a strategy");
    risk_.validate();
}

SimulationResult Backtester::run(const std::vector<Bar>& bars, IndicatorCache* cache, std::ostream* trace) {
    std::unique_ptr<IndicatorCache> own_cache;
    if (!cache) {
        own_cache = std::make_unique<IndicatorCache>(bars);
        cache = own_cache.get();
    } else if (&cache->bars() != &bars) {
        throw ConfigError("indicator cache was built for a different bar window");
    }

    PositionTracker tracker(risk_);
    tracker.setTrace(trace);

    BacktestContext ctx(bars, *cache);
    strategy_->onStart(ctx);

    SimulationResult result;
    result.variant = strategy_->name();
    result.params_text = strategy_->describeParams();
    result.starting_capital = risk_.starting_capital;
    result.equity_curve.reserve(bars.size() + 1);
    result.equity_curve.push_back(risk_.starting_capital);

    for (std::size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        ctx.setBarIndex(i);

        // 1. Risk check preempts the strategy while holding
        if (tracker.holding() && tracker.stopLossTriggered(bar.close)) {
            tracker.sell(bar, i, TradeReason::StopLoss);
        } else {
            // 2. Strategy signal; the tracker ignores BUY while holding and SELL while flat
            Signal signal = strategy_->onBar(bar, ctx);
            if (signal == Signal::Buy)
                tracker.buy(bar, i);
            else if (signal == Signal::Sell)
                tracker.sell(bar, i, TradeReason::Signal);
        }

        // 3. Equity at this bar's close
        result.equity_curve.push_back(tracker.equityAt(bar.close));
    }

    result.trades = tracker.trades();
    result.final_cash = tracker.cash();
    result.open_position = tracker.position();
    result.last_close = bars.empty() ? 0.0 : bars.back().close;
    result.bars_processed = bars.size();
    result.skipped_buys = tracker.skippedBuys();
    result.metrics = computeMetrics(result.trades, result.equity_curve, result.starting_capital,
                                    result.final_cash, result.open_position, result.last_close);
    return result;
}

SimulationResult runSimulation(const std::vector<Bar>& bars,
                               const StrategySpec& spec,
                               const ParamSet& params,
                               const RiskConfig& risk,
                               IndicatorCache* cache) {
    Backtester bt(createStrategy(spec, params), risk);
    SimulationResult r = bt.run(bars, cache);
    r.params = params;
    return r;
}

} // namespace stratbench
