#include "trend_filter_strategy.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "indicator_cache.hpp"
#include "params.hpp"
#include <cmath>
#include <memory>
#include <string>

namespace stratbench {

void TrendFilterParams::validate() const {
    ma.validate();
    switch (filter) {
        case TrendFilter::Atr:
            if (atr_period <= 0 || atr_ma_period <= 0)
                throw ConfigError("ATR periods must be > 0");
            if (!(atr_threshold > 0 && std::isfinite(atr_threshold)))
                throw ConfigError("ATR threshold must be > 0");
            break;
        case TrendFilter::Adx:
            if (adx_period <= 0)
                throw ConfigError("ADX period must be > 0");
            if (!(adx_threshold >= 0 && adx_threshold <= 100))
                throw ConfigError("ADX threshold must lie within 0..100");
            break;
        case TrendFilter::HigherTimeframe:
            if (htf_factor <= 0 || htf_short <= 0 || htf_long <= 0)
                throw ConfigError("higher timeframe factor and periods must be > 0");
            if (htf_short >= htf_long)
                throw ConfigError("higher timeframe short period must be below long period");
            break;
        case TrendFilter::None:
            throw ConfigError("trend filtered crossover needs a filter mode");
    }
}

class TrendFilterStrategy : public IStrategy {
public:
    explicit TrendFilterStrategy(const TrendFilterParams& params)
        : p_(params)
    {
        p_.validate();
        base_ = createMaCrossoverStrategy(p_.ma);
    }

    std::string name() const override {
        switch (p_.filter) {
            case TrendFilter::Atr: return "trend_atr";
            case TrendFilter::Adx: return "trend_adx";
            case TrendFilter::HigherTimeframe: return "trend_htf";
            case TrendFilter::None: break;
        }
        return "trend";
    }

    std::string describeParams() const override {
        std::string s = base_->describeParams();
        switch (p_.filter) {
            case TrendFilter::Atr:
                s += " atr=" + std::to_string(p_.atr_period) + " x" + formatParamValue(p_.atr_threshold) +
                     " ma=" + std::to_string(p_.atr_ma_period);
                break;
            case TrendFilter::Adx:
                s += " adx=" + std::to_string(p_.adx_period) + " >" + formatParamValue(p_.adx_threshold);
                break;
            case TrendFilter::HigherTimeframe:
                s += " htf=" + std::to_string(p_.htf_factor) + "x ma " + std::to_string(p_.htf_short) +
                     "/" + std::to_string(p_.htf_long);
                break;
            case TrendFilter::None:
                break;
        }
        return s;
    }

    void onStart(IContext& ctx) override {
        base_->onStart(ctx);
        IndicatorCache& ind = ctx.indicators();
        switch (p_.filter) {
            case TrendFilter::Atr:
                first_ = ind.atr(p_.atr_period);
                second_ = ind.atrMean(p_.atr_period, p_.atr_ma_period);
                break;
            case TrendFilter::Adx:
                first_ = ind.adx(p_.adx_period);
                break;
            case TrendFilter::HigherTimeframe:
                first_ = ind.higherTimeframeSma(p_.htf_factor, p_.htf_short);
                second_ = ind.higherTimeframeSma(p_.htf_factor, p_.htf_long);
                break;
            case TrendFilter::None:
                break;
        }
    }

    Signal onBar(const Bar& bar, const IContext& ctx) const override {
        Signal base = base_->onBar(bar, ctx);
        if (base != Signal::Buy) return base;
        return trendConfirmed(ctx.barIndex()) ? Signal::Buy : Signal::Hold;
    }

private:
    static const std::optional<double>* at(const IndicatorCache::SeriesPtr& s, std::size_t i) {
        if (!s || i >= s->size() || !(*s)[i]) return nullptr;
        return &(*s)[i];
    }

    bool trendConfirmed(std::size_t i) const {
        const auto* a = at(first_, i);
        switch (p_.filter) {
            case TrendFilter::Atr: {
                const auto* avg = at(second_, i);
                return a && avg && **a > **avg * p_.atr_threshold;
            }
            case TrendFilter::Adx:
                return a && **a > p_.adx_threshold;
            case TrendFilter::HigherTimeframe: {
                const auto* slow = at(second_, i);
                return a && slow && **a > **slow;
            }
            case TrendFilter::None:
                break;
        }
        return false;
    }

    TrendFilterParams p_;
    std::unique_ptr<IStrategy> base_;
    IndicatorCache::SeriesPtr first_;
    IndicatorCache::SeriesPtr second_;
};

std::unique_ptr<IStrategy> createTrendFilterStrategy(const TrendFilterParams& params) {
    return std::make_unique<TrendFilterStrategy>(params);
}

} // namespace stratbench
