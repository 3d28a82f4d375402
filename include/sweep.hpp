#pragma once

#include "backtester.hpp"
#include "indicator_cache.hpp"
#include "params.hpp"
#include "ranking.hpp"
#include "strategy.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace stratbench {

/// A strategy variant and the grid to search.
struct VariantSpec {
    std::string name;
    StrategySpec strategy;
    ParamGrid grid;
};

struct SweepConfig {
    RiskConfig risk;
    std::string split_timestamp;        // train: timestamp < cutoff, test: timestamp >= cutoff
    std::size_t top_n{DEFAULT_TOP_N};
    unsigned threads{0};                // 0 = std::thread::hardware_concurrency()
    bool include_full{true};            // also run every combination over the whole series
    double overfit_threshold_pct{10.0}; // train/test return gap flagged as suspect
    std::ostream* trace{nullptr};       // per-trade trace; forces a single worker

    /// Throws ConfigError.
    void validate() const;
};

/// Best-first results of one variant on one split.
struct RankedReport {
    std::string variant;
    Split split{Split::Train};
    std::size_t total_runs{0};
    std::vector<SimulationResult> top;
};

/// Train-vs-test comparison for one of the best train parameter sets.
struct OverfitCheck {
    std::string variant;
    ParamSet params;
    std::string params_text;
    double train_return_pct{0};
    double test_return_pct{0};
    double difference_pct{0};
    bool suspect{false};
};

/// One line of the cross-strategy summary: the parameters with the best test-split return.
struct ComparisonRow {
    std::string variant;
    SimulationResult test;
    std::optional<double> train_return_pct;
};

struct SweepResult {
    std::vector<RankedReport> reports;
    std::vector<OverfitCheck> overfit_checks;
    std::vector<ComparisonRow> comparison;
    std::size_t runs_total{0};
    std::size_t runs_completed{0};
    bool cancelled{false};
};

/// Side channels of a sweep. Neither affects results.
struct SweepControl {
    const std::atomic<bool>* cancel{nullptr};   // checked between runs
    std::function<void(std::size_t done, std::size_t total)> on_progress;  // called serialized
};

struct DataSplit {
    std::vector<Bar> train;
    std::vector<Bar> test;
};

/// Partition by timestamp cutoff. Throws ConfigError when a side would be empty.
DataSplit splitBars(const std::vector<Bar>& bars, const std::string& cutoff);

/// Timestamp of the first test bar when the first `ratio` of bars is used for training.
std::string splitCutoffAtRatio(const std::vector<Bar>& bars, double ratio);

/// False for combinations the grid produces but that make no sense, e.g. short >= long MA.
bool isMeaningfulCombination(const ParamSet& params);

/// Grid search over strategy variants on train/test (and optionally full) windows.
/// Every (variant, combination, split) is an independent run executed on a pool of
/// std::async workers; results are gathered before any ranking happens.
class ParameterSweep {
public:
    /// Copies and splits the bars; throws ConfigError for invalid config or an empty split.
    ParameterSweep(const std::vector<Bar>& bars, const SweepConfig& config);

    ParameterSweep(const ParameterSweep&) = delete;
    ParameterSweep& operator=(const ParameterSweep&) = delete;

    /// Validate all combinations of all variants (throws ConfigError before any run),
    /// then run them and build reports, overfitting checks and the comparison.
    SweepResult run(const std::vector<VariantSpec>& variants, const SweepControl& control = SweepControl{});

    const std::vector<Bar>& trainBars() const { return train_bars_; }
    const std::vector<Bar>& testBars() const { return test_bars_; }
    const std::vector<Bar>& fullBars() const { return full_bars_; }
    const SweepConfig& config() const { return config_; }

private:
    struct Task {
        std::size_t variant;
        std::size_t combo;
        Split split;
    };

    const std::vector<Bar>& barsFor(Split split) const;
    IndicatorCache& cacheFor(Split split);
    SimulationResult runTask(const VariantSpec& variant, const ParamSet& params, Split split);

    SweepConfig config_;
    std::vector<Bar> full_bars_;
    std::vector<Bar> train_bars_;
    std::vector<Bar> test_bars_;
    std::unique_ptr<IndicatorCache> full_cache_;
    std::unique_ptr<IndicatorCache> train_cache_;
    std::unique_ptr<IndicatorCache> test_cache_;
};

} // namespace stratbench
