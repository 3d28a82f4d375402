#include "data_source.hpp"
#include "errors.hpp"
#include "report.hpp"
#include "strategy.hpp"
#include "sweep.hpp"
#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr double DEFAULT_SPLIT_RATIO = 0.75;
constexpr double TREND_MA_SHORT = 20;
constexpr double TREND_MA_LONG = 50;

std::atomic<bool> g_cancel{false};

extern "C" void onInterrupt(int) {
    g_cancel.store(true);
}

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string data_path = "data/sample_ohlc.csv";
    std::string strategy_name = "all";
    std::string reports_dir = "reports";
    std::string bar_resolution;           // empty = bars as loaded
    std::string split_timestamp;          // empty = derive from split_ratio
    double split_ratio = DEFAULT_SPLIT_RATIO;
    int top_n = static_cast<int>(stratbench::DEFAULT_TOP_N);
    int threads = 0;
    bool include_full = true;
    bool verbose = false;

    double initial_cash = 500.0;
    double fee = 0.001;
    double position_pct = 0.35;
    double min_unit = 0.0001;
    double stop_loss = 0.10;

    // Parameter grids
    std::vector<double> ma_short{5, 10, 15, 20, 25};
    std::vector<double> ma_long{20, 30, 40, 50, 75, 100};
    std::vector<double> rsi_period{7, 14, 21};
    std::vector<double> rsi_oversold{20, 25, 30};
    std::vector<double> rsi_overbought{70, 75, 80};
    std::vector<double> atr_period{14, 20};
    std::vector<double> atr_threshold{1.0, 1.2, 1.5};
    std::vector<double> adx_period{14, 20};
    std::vector<double> adx_threshold{20, 25, 30};
    std::vector<double> htf_factor{4, 24};
    std::vector<double> htf_short{10, 20};
    std::vector<double> htf_long{20, 50};
};

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        if (!std::isfinite(out)) throw std::invalid_argument("not finite");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}
// Comma-separated numbers, e.g. "5,10,20".
bool parseList(const char* s, std::vector<double>& out, std::string& error_msg, const char* flag) {
    std::vector<double> values;
    std::istringstream iss(s);
    std::string item;
    while (std::getline(iss, item, ',')) {
        double v = 0;
        if (!parseDouble(item.c_str(), v, error_msg, flag)) return false;
        values.push_back(v);
    }
    if (values.empty()) {
        error_msg = std::string("Empty list for ") + flag;
        return false;
    }
    out = std::move(values);
    return true;
}

void printUsage(std::ostream& out) {
    out << "Usage: stratbench [options]\n"
           "  --data <csv>            OHLCV CSV (timestamp,open,high,low,close[,volume])\n"
           "  --bar <res>             aggregate to 15m, 1h, 4h or 1d (default: as loaded)\n"
           "  --strategy <name>       all, ma_crossover, rsi_reversal, trend_atr, trend_adx, trend_htf\n"
           "  --cash <x>              starting capital (default 500)\n"
           "  --fee <x>               fee rate per trade (default 0.001)\n"
           "  --position-pct <x>      fraction of cash per entry (default 0.35)\n"
           "  --min-unit <x>          minimum trade quantity (default 0.0001)\n"
           "  --stop-loss <x>         stop-loss fraction, 0 = off (default 0.10)\n"
           "  --split <timestamp>     first test bar timestamp\n"
           "  --split-ratio <x>       train fraction when --split is not given (default 0.75)\n"
           "  --top <n>               results per table (default 5)\n"
           "  --threads <n>           worker threads, 0 = hardware (default 0)\n"
           "  --no-full               skip the full-series runs\n"
           "  --verbose               per-trade trace (single worker)\n"
           "  --reports-dir <dir>     output directory (default reports)\n"
           "  Grid overrides (comma lists): --short --long --rsi-period --oversold --overbought\n"
           "    --atr-period --atr-threshold --adx-period --adx-threshold\n"
           "    --htf-factor --htf-short --htf-long\n";
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() { return i + 1 < argc ? argv[++i] : nullptr; };
        auto missing = [&]() { error_msg = "Missing value for " + arg; return false; };

        if (arg == "--data") { if (!next()) return missing(); cfg.data_path = argv[i]; }
        else if (arg == "--strategy") { if (!next()) return missing(); cfg.strategy_name = argv[i]; }
        else if (arg == "--reports-dir") { if (!next()) return missing(); cfg.reports_dir = argv[i]; }
        else if (arg == "--bar") { if (!next()) return missing(); cfg.bar_resolution = argv[i]; }
        else if (arg == "--split") { if (!next()) return missing(); cfg.split_timestamp = argv[i]; }
        else if (arg == "--split-ratio") { if (!next() || !parseDouble(argv[i], cfg.split_ratio, error_msg, "--split-ratio")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--cash") { if (!next() || !parseDouble(argv[i], cfg.initial_cash, error_msg, "--cash")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--fee") { if (!next() || !parseDouble(argv[i], cfg.fee, error_msg, "--fee")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--position-pct") { if (!next() || !parseDouble(argv[i], cfg.position_pct, error_msg, "--position-pct")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--min-unit") { if (!next() || !parseDouble(argv[i], cfg.min_unit, error_msg, "--min-unit")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--stop-loss") { if (!next() || !parseDouble(argv[i], cfg.stop_loss, error_msg, "--stop-loss")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--top") { if (!next() || !parseInt(argv[i], cfg.top_n, error_msg, "--top")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--threads") { if (!next() || !parseInt(argv[i], cfg.threads, error_msg, "--threads")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--short") { if (!next() || !parseList(argv[i], cfg.ma_short, error_msg, "--short")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--long") { if (!next() || !parseList(argv[i], cfg.ma_long, error_msg, "--long")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--rsi-period") { if (!next() || !parseList(argv[i], cfg.rsi_period, error_msg, "--rsi-period")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--oversold") { if (!next() || !parseList(argv[i], cfg.rsi_oversold, error_msg, "--oversold")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--overbought") { if (!next() || !parseList(argv[i], cfg.rsi_overbought, error_msg, "--overbought")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--atr-period") { if (!next() || !parseList(argv[i], cfg.atr_period, error_msg, "--atr-period")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--atr-threshold") { if (!next() || !parseList(argv[i], cfg.atr_threshold, error_msg, "--atr-threshold")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--adx-period") { if (!next() || !parseList(argv[i], cfg.adx_period, error_msg, "--adx-period")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--adx-threshold") { if (!next() || !parseList(argv[i], cfg.adx_threshold, error_msg, "--adx-threshold")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--htf-factor") { if (!next() || !parseList(argv[i], cfg.htf_factor, error_msg, "--htf-factor")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--htf-short") { if (!next() || !parseList(argv[i], cfg.htf_short, error_msg, "--htf-short")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--htf-long") { if (!next() || !parseList(argv[i], cfg.htf_long, error_msg, "--htf-long")) return error_msg.empty() ? missing() : false; }
        else if (arg == "--no-full") { cfg.include_full = false; }
        else if (arg == "--verbose" || arg == "-v") { cfg.verbose = true; }
        else if (arg == "--help" || arg == "-h") { printUsage(std::cout); std::exit(0); }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if config is invalid.
/// Risk and strategy parameters are validated again by the core (ConfigError).
bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (!(cfg.initial_cash > 0) || std::isinf(cfg.initial_cash)) { error_msg = "starting capital (--cash) must be > 0"; return false; }
    if (!(cfg.fee >= 0 && cfg.fee < 1)) { error_msg = "--fee must be in [0, 1)"; return false; }
    if (!(cfg.position_pct > 0 && cfg.position_pct <= 1)) { error_msg = "--position-pct must be in (0, 1]"; return false; }
    if (!(cfg.min_unit >= 0) || std::isinf(cfg.min_unit)) { error_msg = "--min-unit must be >= 0"; return false; }
    if (!(cfg.stop_loss >= 0 && cfg.stop_loss < 1)) { error_msg = "--stop-loss must be in [0, 1)"; return false; }
    if (cfg.split_timestamp.empty() && !(cfg.split_ratio > 0 && cfg.split_ratio < 1)) {
        error_msg = "--split-ratio must be in (0, 1)";
        return false;
    }
    if (cfg.top_n < 1) { error_msg = "--top must be >= 1"; return false; }
    if (cfg.threads < 0) { error_msg = "--threads must be >= 0"; return false; }
    return true;
}

//-----------------------------------------------------------------------------
// Variants: one place mapping strategy names to their grids
//-----------------------------------------------------------------------------
stratbench::VariantSpec buildVariant(const std::string& name, const Config& cfg) {
    using namespace stratbench;
    VariantSpec v;
    v.name = name;
    v.strategy = parseStrategySpec(name);
    const std::vector<double> trend_short{TREND_MA_SHORT};
    const std::vector<double> trend_long{TREND_MA_LONG};

    switch (v.strategy.kind) {
        case StrategyKind::MaCrossover:
            v.grid = {{"short", cfg.ma_short}, {"long", cfg.ma_long}};
            break;
        case StrategyKind::RsiReversal:
            v.grid = {{"period", cfg.rsi_period}, {"oversold", cfg.rsi_oversold},
                      {"overbought", cfg.rsi_overbought}};
            break;
        case StrategyKind::TrendFilteredCrossover:
            v.grid = {{"short", trend_short}, {"long", trend_long}};
            if (v.strategy.filter == TrendFilter::Atr) {
                v.grid.push_back({"atr_period", cfg.atr_period});
                v.grid.push_back({"atr_threshold", cfg.atr_threshold});
            } else if (v.strategy.filter == TrendFilter::Adx) {
                v.grid.push_back({"adx_period", cfg.adx_period});
                v.grid.push_back({"adx_threshold", cfg.adx_threshold});
            } else if (v.strategy.filter == TrendFilter::HigherTimeframe) {
                v.grid.push_back({"htf_factor", cfg.htf_factor});
                v.grid.push_back({"htf_short", cfg.htf_short});
                v.grid.push_back({"htf_long", cfg.htf_long});
            }
            break;
    }
    return v;
}

std::vector<stratbench::VariantSpec> buildVariants(const Config& cfg) {
    static const char* const ALL[] = {"ma_crossover", "rsi_reversal", "trend_atr", "trend_adx", "trend_htf"};
    std::vector<stratbench::VariantSpec> variants;
    if (cfg.strategy_name == "all") {
        for (const char* name : ALL)
            variants.push_back(buildVariant(name, cfg));
    } else {
        variants.push_back(buildVariant(cfg.strategy_name, cfg));
    }
    return variants;
}

//-----------------------------------------------------------------------------
// Sweep: load, split, run, report, write files
//-----------------------------------------------------------------------------
int runSweep(const Config& cfg) {
    using namespace stratbench;

    DataSource data(cfg.data_path);
    if (!data.load()) {
        std::cerr << "Failed to load bars (check data file: " << cfg.data_path << ")\n";
        return 1;
    }
    if (data.skippedRows() > 0)
        std::cerr << "Skipped " << data.skippedRows() << " unusable or duplicate rows\n";
    if (!data.aggregateBars(cfg.bar_resolution)) {
        std::cerr << "Unknown bar resolution: " << cfg.bar_resolution << " (use 1m, 15m, 1h, 4h, 1d)\n";
        return 1;
    }
    if (data.empty()) {
        std::cerr << "No bars in " << cfg.data_path << "\n";
        return 1;
    }
    std::cout << "Loaded " << data.size() << " bars (" << data.at(0).timestamp << " .. "
              << data.at(data.size() - 1).timestamp << ")\n";

    std::vector<VariantSpec> variants = buildVariants(cfg);

    SweepConfig sc;
    sc.risk.starting_capital = cfg.initial_cash;
    sc.risk.fee_rate = cfg.fee;
    sc.risk.position_size_pct = cfg.position_pct;
    sc.risk.min_trade_unit = cfg.min_unit;
    sc.risk.stop_loss_pct = cfg.stop_loss;
    sc.split_timestamp = cfg.split_timestamp.empty()
        ? splitCutoffAtRatio(data.bars(), cfg.split_ratio)
        : cfg.split_timestamp;
    sc.top_n = static_cast<std::size_t>(cfg.top_n);
    sc.threads = static_cast<unsigned>(cfg.threads);
    sc.include_full = cfg.include_full;
    if (cfg.verbose) sc.trace = &std::cout;

    ParameterSweep sweep(data.bars(), sc);

    SweepControl control;
    control.cancel = &g_cancel;
    if (!cfg.verbose) {
        control.on_progress = [](std::size_t done, std::size_t total) {
            std::cout << "\rRunning " << done << "/" << total << std::flush;
            if (done == total) std::cout << "\n";
        };
    }
    std::signal(SIGINT, onInterrupt);
    SweepResult result = sweep.run(variants, control);
    std::signal(SIGINT, SIG_DFL);
    if (result.cancelled)
        std::cerr << "\nInterrupted: " << result.runs_completed << "/" << result.runs_total
                  << " runs completed, reporting partial results\n";

    Report report(sweep, result, cfg.data_path);
    report.printSummary(std::cout);

    fs::create_directories(cfg.reports_dir);
    bool ok = report.writeResultsCsv((fs::path(cfg.reports_dir) / "sweep_results.csv").string());
    ok = report.writeComparisonCsv((fs::path(cfg.reports_dir) / "comparison.csv").string()) && ok;
    ok = report.writeTradeLog((fs::path(cfg.reports_dir) / "best_trades.csv").string()) && ok;
    ok = report.writeReport((fs::path(cfg.reports_dir) / "report.txt").string()) && ok;
    if (!ok) return 1;
    std::cout << "Reports written to " << cfg.reports_dir << "/\n";
    return result.cancelled ? 130 : 0;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    // Resolve default data path when running from build/
    if (!(fs::exists(cfg.data_path) && fs::is_regular_file(cfg.data_path)) &&
         fs::exists("../data/sample_ohlc.csv") && fs::is_regular_file("../data/sample_ohlc.csv"))
        cfg.data_path = "../data/sample_ohlc.csv";

    try {
        return runSweep(cfg);
    } catch (const stratbench::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Filesystem error: " << e.what() << "\n";
        return 1;
    }
}
