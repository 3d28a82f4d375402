#pragma once

#include "strategy.hpp"
#include <memory>

namespace stratbench {

/// RSI mean reversion: BUY when RSI < oversold, SELL when RSI > overbought.
struct RsiReversalParams {
    int period = 14;
    double oversold = 30;
    double overbought = 70;

    /// Throws ConfigError for period <= 0, levels outside [0, 100] or oversold >= overbought.
    void validate() const;
};

std::unique_ptr<IStrategy> createRsiReversalStrategy(const RsiReversalParams& params = RsiReversalParams{});

} // namespace stratbench
