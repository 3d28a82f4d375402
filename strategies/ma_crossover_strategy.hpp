#pragma once

#include "strategy.hpp"
#include <memory>

namespace stratbench {

/// Moving-average crossover: BUY on golden cross, SELL on dead cross.
struct MaCrossoverParams {
    int short_period = 10;
    int long_period = 20;

    /// Throws ConfigError unless 0 < short_period < long_period.
    void validate() const;
};

std::unique_ptr<IStrategy> createMaCrossoverStrategy(const MaCrossoverParams& params = MaCrossoverParams{});

} // namespace stratbench
