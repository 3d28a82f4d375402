#include "metrics.hpp"
#include <limits>

namespace stratbench {

double maxDrawdownPct(const std::vector<double>& equity_curve) {
    if (equity_curve.empty()) return 0;
    double peak = equity_curve[0];
    double max_dd = 0;
    for (double eq : equity_curve) {
        if (eq > peak) peak = eq;
        double dd = (peak > 0) ? (peak - eq) / peak * 100.0 : 0;
        if (dd > max_dd) max_dd = dd;
    }
    return max_dd;
}

Metrics computeMetrics(const std::vector<Trade>& trades,
                       const std::vector<double>& equity_curve,
                       double initial_capital,
                       double final_cash,
                       const std::optional<Position>& open_position,
                       double last_close) {
    Metrics m;
    m.initial_equity = initial_capital;
    m.realized_capital = final_cash + (open_position ? open_position->cost : 0.0);
    m.final_equity = final_cash + (open_position ? open_position->quantity * last_close : 0.0);
    if (initial_capital != 0) {
        m.return_pct = (m.realized_capital - initial_capital) / initial_capital * 100.0;
        m.mark_to_market_return_pct = (m.final_equity - initial_capital) / initial_capital * 100.0;
    }
    if (open_position) {
        m.open_quantity = open_position->quantity;
        m.unrealized_pnl = open_position->quantity * last_close - open_position->cost;
    }

    m.max_drawdown_pct = maxDrawdownPct(equity_curve);

    // Every SELL closes the round trip opened by the preceding BUY.
    double gross_profit = 0;
    double gross_loss = 0;
    for (const auto& t : trades) {
        if (t.action != TradeAction::Sell) continue;
        ++m.num_trades;
        if (t.pnl > 0) {
            ++m.winning_trades;
            gross_profit += t.pnl;
        } else if (t.pnl < 0) {
            gross_loss += -t.pnl;
        }
        if (t.reason == TradeReason::StopLoss) ++m.stop_loss_exits;
    }
    m.win_rate_pct = (m.num_trades > 0) ? (100.0 * m.winning_trades / m.num_trades) : 0;
    if (gross_loss > 0)
        m.profit_factor = gross_profit / gross_loss;
    else if (gross_profit > 0)
        m.profit_factor = std::numeric_limits<double>::infinity();

    return m;
}

} // namespace stratbench
