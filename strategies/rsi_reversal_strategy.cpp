#include "rsi_reversal_strategy.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "indicator_cache.hpp"
#include "params.hpp"
#include <memory>
#include <string>

namespace stratbench {

void RsiReversalParams::validate() const {
    if (period <= 0)
        throw ConfigError("RSI period must be > 0");
    if (!(oversold >= 0 && oversold <= 100) || !(overbought >= 0 && overbought <= 100))
        throw ConfigError("RSI levels must lie within 0..100");
    if (oversold >= overbought)
        throw ConfigError("RSI oversold (" + formatParamValue(oversold) +
                          ") must be below overbought (" + formatParamValue(overbought) + ")");
}

class RsiReversalStrategy : public IStrategy {
public:
    explicit RsiReversalStrategy(const RsiReversalParams& params) : p_(params) {
        p_.validate();
    }

    std::string name() const override { return "rsi_reversal"; }

    std::string describeParams() const override {
        return "period=" + std::to_string(p_.period) + " oversold=" + formatParamValue(p_.oversold) +
               " overbought=" + formatParamValue(p_.overbought);
    }

    void onStart(IContext& ctx) override {
        rsi_ = ctx.indicators().rsi(p_.period);
    }

    Signal onBar(const Bar& /*bar*/, const IContext& ctx) const override {
        std::size_t i = ctx.barIndex();
        if (!rsi_ || i >= rsi_->size() || !(*rsi_)[i]) return Signal::Hold;
        double value = *(*rsi_)[i];
        if (value < p_.oversold) return Signal::Buy;
        if (value > p_.overbought) return Signal::Sell;
        return Signal::Hold;
    }

private:
    RsiReversalParams p_;
    IndicatorCache::SeriesPtr rsi_;
};

std::unique_ptr<IStrategy> createRsiReversalStrategy(const RsiReversalParams& params) {
    return std::make_unique<RsiReversalStrategy>(params);
}

} // namespace stratbench
