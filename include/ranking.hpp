#pragma once

#include "backtester.hpp"
#include <cstddef>
#include <vector>

namespace stratbench {

constexpr std::size_t DEFAULT_TOP_N = 5;

/// Ordering used for ranking: higher return first; on equal return, fewer round trips first.
bool ranksBefore(const SimulationResult& a, const SimulationResult& b);

/// Best-first copy of `results`, truncated to `top_n`. Equal results keep their input order.
std::vector<SimulationResult> rankResults(std::vector<SimulationResult> results,
                                          std::size_t top_n = DEFAULT_TOP_N);

} // namespace stratbench
