#include "ranking.hpp"
#include <algorithm>

namespace stratbench {

bool ranksBefore(const SimulationResult& a, const SimulationResult& b) {
    if (a.metrics.return_pct != b.metrics.return_pct)
        return a.metrics.return_pct > b.metrics.return_pct;
    return a.metrics.num_trades < b.metrics.num_trades;
}

std::vector<SimulationResult> rankResults(std::vector<SimulationResult> results, std::size_t top_n) {
    std::stable_sort(results.begin(), results.end(), ranksBefore);
    if (results.size() > top_n) results.resize(top_n);
    return results;
}

} // namespace stratbench
