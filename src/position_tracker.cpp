#include "position_tracker.hpp"
#include "errors.hpp"
#include <cmath>

namespace stratbench {

void RiskConfig::validate() const {
    if (!(starting_capital > 0))
        throw ConfigError("starting capital must be > 0");
    if (!std::isfinite(starting_capital))
        throw ConfigError("starting capital must be finite");
    // Written so that NaN fails every range check.
    if (!(fee_rate >= 0 && fee_rate < 1))
        throw ConfigError("fee rate must be in [0, 1)");
    if (!(position_size_pct > 0 && position_size_pct <= 1))
        throw ConfigError("position size must be in (0, 1]");
    if (!(min_trade_unit >= 0 && std::isfinite(min_trade_unit)))
        throw ConfigError("minimum trade unit must be >= 0");
    if (!(stop_loss_pct >= 0 && stop_loss_pct < 1))
        throw ConfigError("stop loss must be in [0, 1)");
}

PositionTracker::PositionTracker(const RiskConfig& config)
    : config_(config)
    , cash_(config.starting_capital)
{
    config_.validate();
}

bool PositionTracker::stopLossTriggered(double price) const {
    if (!position_ || config_.stop_loss_pct <= 0 || position_->entry_price <= 0) return false;
    return price <= position_->entry_price * (1.0 - config_.stop_loss_pct);
}

bool PositionTracker::buy(const Bar& bar, std::size_t bar_index) {
    if (position_) return false;

    const double price = bar.close;
    const double spend = cash_ * config_.position_size_pct;
    const double quantity = (price > 0) ? spend / price * (1.0 - config_.fee_rate) : 0.0;
    if (spend <= 0 || quantity < config_.min_trade_unit || quantity <= 0) {
        ++skipped_buys_;
        if (trace_)
            *trace_ << "  " << bar.timestamp << ": skipped BUY @ " << price
                    << " (cash " << cash_ << ", qty " << quantity << " below minimum)\n";
        return false;
    }

    cash_ -= spend;

    Position p;
    p.entry_price = price;
    p.quantity = quantity;
    p.cost = spend;
    p.entry_time = bar.timestamp;
    p.entry_index = bar_index;
    position_ = p;

    Trade t;
    t.bar_index = bar_index;
    t.timestamp = bar.timestamp;
    t.action = TradeAction::Buy;
    t.reason = TradeReason::Signal;
    t.price = price;
    t.quantity = quantity;
    t.fee = spend * config_.fee_rate;
    t.notional = spend;
    t.cash_after = cash_;
    t.units_after = quantity;
    trades_.push_back(t);

    if (trace_)
        *trace_ << "  " << bar.timestamp << ": BUY @ " << price << " qty " << quantity << "\n";
    return true;
}

bool PositionTracker::sell(const Bar& bar, std::size_t bar_index, TradeReason reason) {
    if (!position_) return false;

    const double price = bar.close;
    const double gross = position_->quantity * price;
    const double proceeds = gross * (1.0 - config_.fee_rate);
    cash_ += proceeds;

    Trade t;
    t.bar_index = bar_index;
    t.timestamp = bar.timestamp;
    t.action = TradeAction::Sell;
    t.reason = reason;
    t.price = price;
    t.quantity = position_->quantity;
    t.fee = gross * config_.fee_rate;
    t.notional = proceeds;
    t.cash_after = cash_;
    t.units_after = 0;
    t.pnl = proceeds - position_->cost;
    trades_.push_back(t);

    if (trace_)
        *trace_ << "  " << bar.timestamp << ": " << (reason == TradeReason::StopLoss ? "STOP LOSS" : "SELL")
                << " @ " << price << " pnl " << t.pnl << "\n";

    position_.reset();
    return true;
}

double PositionTracker::equityAt(double price) const {
    return position_ ? cash_ + position_->quantity * price : cash_;
}

} // namespace stratbench
