#include "sweep.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <mutex>
#include <thread>

namespace stratbench {

void SweepConfig::validate() const {
    risk.validate();
    if (split_timestamp.empty())
        throw ConfigError("train/test split timestamp is required");
    if (top_n == 0)
        throw ConfigError("top N must be >= 1");
    if (overfit_threshold_pct < 0)
        throw ConfigError("overfit threshold must be >= 0");
}

DataSplit splitBars(const std::vector<Bar>& bars, const std::string& cutoff) {
    DataSplit split;
    for (const Bar& b : bars) {
        if (b.timestamp < cutoff) split.train.push_back(b);
        else split.test.push_back(b);
    }
    if (split.train.empty())
        throw ConfigError("no training bars before split " + cutoff);
    if (split.test.empty())
        throw ConfigError("no test bars at or after split " + cutoff);
    return split;
}

std::string splitCutoffAtRatio(const std::vector<Bar>& bars, double ratio) {
    if (!(ratio > 0 && ratio < 1))
        throw ConfigError("split ratio must be in (0, 1)");
    std::size_t idx = static_cast<std::size_t>(std::floor(bars.size() * ratio));
    if (idx == 0 || idx >= bars.size())
        throw ConfigError("split ratio leaves an empty train or test range");
    return bars[idx].timestamp;
}

bool isMeaningfulCombination(const ParamSet& params) {
    auto s = params.find("short");
    auto l = params.find("long");
    if (s && l && *s >= *l) return false;
    auto hs = params.find("htf_short");
    auto hl = params.find("htf_long");
    if (hs && hl && *hs >= *hl) return false;
    return true;
}

ParameterSweep::ParameterSweep(const std::vector<Bar>& bars, const SweepConfig& config)
    : config_(config)
    , full_bars_(bars)
{
    config_.validate();
    DataSplit split = splitBars(full_bars_, config_.split_timestamp);
    train_bars_ = std::move(split.train);
    test_bars_ = std::move(split.test);

    // Caches reference the member vectors, which no longer change from here on.
    full_cache_ = std::make_unique<IndicatorCache>(full_bars_);
    train_cache_ = std::make_unique<IndicatorCache>(train_bars_);
    test_cache_ = std::make_unique<IndicatorCache>(test_bars_);
}

const std::vector<Bar>& ParameterSweep::barsFor(Split split) const {
    switch (split) {
        case Split::Train: return train_bars_;
        case Split::Test: return test_bars_;
        case Split::Full: break;
    }
    return full_bars_;
}

IndicatorCache& ParameterSweep::cacheFor(Split split) {
    switch (split) {
        case Split::Train: return *train_cache_;
        case Split::Test: return *test_cache_;
        case Split::Full: break;
    }
    return *full_cache_;
}

SimulationResult ParameterSweep::runTask(const VariantSpec& variant, const ParamSet& params, Split split) {
    Backtester bt(createStrategy(variant.strategy, params), config_.risk);
    if (config_.trace)
        *config_.trace << "--- " << variant.name << " " << bt.strategy().describeParams()
                       << " [" << toString(split) << "] ---\n";
    SimulationResult r = bt.run(barsFor(split), &cacheFor(split), config_.trace);
    r.variant = variant.name;
    r.params = params;
    r.split = split;
    return r;
}

SweepResult ParameterSweep::run(const std::vector<VariantSpec>& variants, const SweepControl& control) {
    if (variants.empty())
        throw ConfigError("no strategy variants to sweep");

    // Expand and validate everything up front: a bad grid fails before the first run.
    std::vector<std::vector<ParamSet>> combos(variants.size());
    for (std::size_t v = 0; v < variants.size(); ++v) {
        for (const auto& p : expandGrid(variants[v].grid)) {
            if (!isMeaningfulCombination(p)) continue;
            try {
                createStrategy(variants[v].strategy, p);
            } catch (const ConfigError& e) {
                throw ConfigError(variants[v].name + " (" + p.toString() + "): " + e.what());
            }
            combos[v].push_back(p);
        }
        if (combos[v].empty())
            throw ConfigError(variants[v].name + ": parameter grid has no valid combination");
    }

    std::vector<Split> splits{Split::Train, Split::Test};
    if (config_.include_full) splits.push_back(Split::Full);

    std::vector<Task> tasks;
    for (std::size_t v = 0; v < variants.size(); ++v)
        for (Split s : splits)
            for (std::size_t c = 0; c < combos[v].size(); ++c)
                tasks.push_back({v, c, s});

    // One slot per task: workers never share a result.
    std::vector<std::optional<SimulationResult>> slots(tasks.size());
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> done{0};
    std::mutex progress_mutex;

    unsigned workers = config_.threads;
    if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
    if (config_.trace) workers = 1;
    workers = static_cast<unsigned>(std::min<std::size_t>(workers, tasks.size()));

    auto worker = [&]() {
        for (;;) {
            if (control.cancel && control.cancel->load()) return;
            std::size_t idx = next.fetch_add(1);
            if (idx >= tasks.size()) return;
            const Task& t = tasks[idx];
            slots[idx] = runTask(variants[t.variant], combos[t.variant][t.combo], t.split);
            std::size_t finished = done.fetch_add(1) + 1;
            if (control.on_progress) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                control.on_progress(finished, tasks.size());
            }
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (unsigned w = 0; w < workers; ++w)
        futures.push_back(std::async(std::launch::async, worker));
    for (auto& f : futures)
        f.get();

    SweepResult out;
    out.runs_total = tasks.size();
    out.runs_completed = done.load();
    out.cancelled = out.runs_completed < out.runs_total;

    // Barrier passed: group by (variant, split) in task order, then rank.
    for (std::size_t v = 0; v < variants.size(); ++v) {
        std::vector<SimulationResult> per_split[3];
        for (std::size_t i = 0; i < tasks.size(); ++i) {
            if (tasks[i].variant != v || !slots[i]) continue;
            per_split[static_cast<int>(tasks[i].split)].push_back(*slots[i]);
        }

        for (Split s : splits) {
            RankedReport report;
            report.variant = variants[v].name;
            report.split = s;
            report.total_runs = per_split[static_cast<int>(s)].size();
            report.top = rankResults(per_split[static_cast<int>(s)], config_.top_n);
            out.reports.push_back(std::move(report));
        }

        const auto& train_all = per_split[static_cast<int>(Split::Train)];
        const auto& test_all = per_split[static_cast<int>(Split::Test)];
        auto findTest = [&](const ParamSet& p) -> const SimulationResult* {
            for (const auto& r : test_all)
                if (r.params == p) return &r;
            return nullptr;
        };
        auto findTrain = [&](const ParamSet& p) -> const SimulationResult* {
            for (const auto& r : train_all)
                if (r.params == p) return &r;
            return nullptr;
        };

        for (const auto& tr : rankResults(train_all, config_.top_n)) {
            const SimulationResult* te = findTest(tr.params);
            if (!te) continue;
            OverfitCheck c;
            c.variant = variants[v].name;
            c.params = tr.params;
            c.params_text = tr.params_text;
            c.train_return_pct = tr.metrics.return_pct;
            c.test_return_pct = te->metrics.return_pct;
            c.difference_pct = std::abs(c.train_return_pct - c.test_return_pct);
            c.suspect = c.difference_pct > config_.overfit_threshold_pct;
            out.overfit_checks.push_back(std::move(c));
        }

        // Selection uses the out-of-sample split only.
        auto best_test = rankResults(test_all, 1);
        if (!best_test.empty()) {
            ComparisonRow row;
            row.variant = variants[v].name;
            row.test = best_test.front();
            if (const SimulationResult* tr = findTrain(row.test.params))
                row.train_return_pct = tr->metrics.return_pct;
            out.comparison.push_back(std::move(row));
        }
    }
    return out;
}

} // namespace stratbench
