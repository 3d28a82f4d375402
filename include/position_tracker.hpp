#pragma once

#include "bar.hpp"
#include "signal.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace stratbench {

/// Capital and risk settings of one simulation run.
struct RiskConfig {
    double starting_capital{500.0};
    double fee_rate{0.001};           // fraction of traded value, e.g. 0.001 = 0.1%
    double position_size_pct{0.35};   // fraction of cash committed per entry
    double min_trade_unit{0.0001};    // smallest tradable quantity
    double stop_loss_pct{0.10};       // exit when price drops this fraction below entry; 0 = off

    /// Throws ConfigError for non-positive capital or fractions outside their range.
    void validate() const;
};

/// The single open lot.
struct Position {
    double entry_price{0};
    double quantity{0};
    double cost{0};                 // cash spent, entry fee included
    std::string entry_time;
    std::size_t entry_index{0};
};

/// One executed trade.
struct Trade {
    std::size_t bar_index{0};
    std::string timestamp;
    TradeAction action{TradeAction::Buy};
    TradeReason reason{TradeReason::Signal};
    double price{0};
    double quantity{0};
    double fee{0};
    double notional{0};             // cash paid (BUY) or received (SELL), after fees
    double cash_after{0};
    double units_after{0};
    double pnl{0};                  // SELL only: proceeds - position cost
};

/// Holds cash and at most one open position. Two states: flat (no position) and holding.
/// BUY while holding and SELL while flat are ignored; an unfundable BUY is skipped and counted.
class PositionTracker {
public:
    explicit PositionTracker(const RiskConfig& config);

    bool holding() const { return position_.has_value(); }
    const std::optional<Position>& position() const { return position_; }
    double cash() const { return cash_; }
    const std::vector<Trade>& trades() const { return trades_; }
    int skippedBuys() const { return skipped_buys_; }

    /// True when holding and price <= entry * (1 - stop_loss_pct). Boundary is inclusive.
    bool stopLossTriggered(double price) const;

    /// Enter at bar.close. Returns false when already holding or when the sized quantity
    /// is below the minimum unit (then counted as skipped).
    bool buy(const Bar& bar, std::size_t bar_index);

    /// Liquidate the whole position at bar.close. Returns false when flat.
    bool sell(const Bar& bar, std::size_t bar_index, TradeReason reason);

    /// Cash plus position valued at `price`.
    double equityAt(double price) const;

    /// Optional stream receiving one line per executed trade or skipped entry.
    void setTrace(std::ostream* trace) { trace_ = trace; }

private:
    RiskConfig config_;
    double cash_;
    std::optional<Position> position_;
    std::vector<Trade> trades_;
    int skipped_buys_{0};
    std::ostream* trace_{nullptr};
};

} // namespace stratbench
