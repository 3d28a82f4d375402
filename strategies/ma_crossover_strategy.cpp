#include "ma_crossover_strategy.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "indicator_cache.hpp"
#include <memory>
#include <string>

namespace stratbench {

void MaCrossoverParams::validate() const {
    if (short_period <= 0 || long_period <= 0)
        throw ConfigError("MA periods must be > 0");
    if (short_period >= long_period)
        throw ConfigError("short MA period (" + std::to_string(short_period) +
                          ") must be below long MA period (" + std::to_string(long_period) + ")");
}

/// Golden cross: short SMA was <= long SMA on the previous bar and is > on this one.
/// Dead cross: short was >= long and is now <. Equality never counts as crossed.
class MaCrossoverStrategy : public IStrategy {
public:
    explicit MaCrossoverStrategy(const MaCrossoverParams& params) : p_(params) {
        p_.validate();
    }

    std::string name() const override { return "ma_crossover"; }

    std::string describeParams() const override {
        return "short=" + std::to_string(p_.short_period) + " long=" + std::to_string(p_.long_period);
    }

    void onStart(IContext& ctx) override {
        short_sma_ = ctx.indicators().sma(p_.short_period);
        long_sma_ = ctx.indicators().sma(p_.long_period);
    }

    Signal onBar(const Bar& /*bar*/, const IContext& ctx) const override {
        std::size_t i = ctx.barIndex();
        if (i == 0 || !short_sma_ || !long_sma_ || i >= short_sma_->size()) return Signal::Hold;

        const auto& cur_s = (*short_sma_)[i];
        const auto& cur_l = (*long_sma_)[i];
        const auto& prev_s = (*short_sma_)[i - 1];
        const auto& prev_l = (*long_sma_)[i - 1];
        if (!cur_s || !cur_l || !prev_s || !prev_l) return Signal::Hold;

        if (*prev_s <= *prev_l && *cur_s > *cur_l) return Signal::Buy;
        if (*prev_s >= *prev_l && *cur_s < *cur_l) return Signal::Sell;
        return Signal::Hold;
    }

private:
    MaCrossoverParams p_;
    IndicatorCache::SeriesPtr short_sma_;
    IndicatorCache::SeriesPtr long_sma_;
};

std::unique_ptr<IStrategy> createMaCrossoverStrategy(const MaCrossoverParams& params) {
    return std::make_unique<MaCrossoverStrategy>(params);
}

} // namespace stratbench
