#pragma once

#include "position_tracker.hpp"
#include <optional>
#include <vector>

namespace stratbench {

/// Performance metrics of one simulation run.
/// The headline return is realized-only: an open position is carried at its cost.
/// Mark-to-market figures are kept separately.
struct Metrics {
    double return_pct{0};                 // (realized_capital - initial) / initial * 100
    double mark_to_market_return_pct{0};  // (final_equity - initial) / initial * 100
    double max_drawdown_pct{0};           // max peak-to-trough decline of the equity curve
    int num_trades{0};                    // completed round trips
    int winning_trades{0};
    double win_rate_pct{0};
    double profit_factor{0};              // gross profit / gross loss; inf if no losing trade
    int stop_loss_exits{0};
    double initial_equity{0};
    double realized_capital{0};           // cash + open position cost
    double final_equity{0};               // cash + open position at last close
    double open_quantity{0};              // 0 = flat at the end
    double unrealized_pnl{0};             // mark-to-market P&L of the open position
};

/// Derive metrics from a finished run.
/// equity_curve: starting capital followed by the mark-to-market equity after each bar.
Metrics computeMetrics(const std::vector<Trade>& trades,
                       const std::vector<double>& equity_curve,
                       double initial_capital,
                       double final_cash,
                       const std::optional<Position>& open_position,
                       double last_close);

/// Largest peak-to-trough decline in percent (0 for an empty or rising curve).
double maxDrawdownPct(const std::vector<double>& equity_curve);

} // namespace stratbench
