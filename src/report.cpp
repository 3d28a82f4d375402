#include "report.hpp"
#include <fstream>
#include <iomanip>
#include <cmath>
#include <sstream>
#include <iostream>

namespace stratbench {

namespace {

constexpr int PARAMS_WIDTH = 44;

std::string formatNumber(double v, int precision) {
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << v;
    return ss.str();
}

void writeCsvQuoted(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\"\"";
        else out << c;
    }
    out << '"';
}

bool openForWriting(std::ofstream& f, const std::string& filepath) {
    f.open(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
    return true;
}

} // namespace

Report::Report(const ParameterSweep& sweep, const SweepResult& result, const std::string& data_label)
    : sweep_(sweep), result_(result), data_label_(data_label) {}

void Report::printReportHeader(std::ostream& out) const {
    const SweepConfig& cfg = sweep_.config();
    if (!data_label_.empty())
        out << "Data:           " << data_label_ << "\n";
    out << "Bars:           " << sweep_.fullBars().size()
        << " (train " << sweep_.trainBars().size()
        << ", test " << sweep_.testBars().size() << ")\n";
    out << "Split at:       " << cfg.split_timestamp << "\n";
    out << "Capital:        " << formatNumber(cfg.risk.starting_capital, 2) << "\n";
    out << "Position size:  " << formatNumber(cfg.risk.position_size_pct * 100.0, 2) << "%\n";
    out << "Stop-loss:      " << formatNumber(cfg.risk.stop_loss_pct * 100.0, 2) << "%\n";
    out << "Fee:            " << formatNumber(cfg.risk.fee_rate * 100.0, 3) << "%\n";
    out << "Runs:           " << result_.runs_completed << "/" << result_.runs_total;
    if (result_.cancelled) out << " (cancelled)";
    out << "\n";
}

void Report::printRankedReport(std::ostream& out, const RankedReport& report) const {
    out << "\n--- " << report.variant << " [" << toString(report.split) << "] top "
        << report.top.size() << " of " << report.total_runs << " ---\n";
    if (report.top.empty()) {
        out << "  (no results)\n";
        return;
    }
    out << std::left << std::setw(5) << "#" << std::setw(PARAMS_WIDTH) << "Params" << std::right
        << std::setw(10) << "Return %" << std::setw(10) << "MtM %" << std::setw(10) << "MaxDD %"
        << std::setw(8) << "Trades" << std::setw(8) << "Win %" << std::setw(8) << "PF"
        << std::setw(5) << "SL" << std::setw(6) << "Open" << "\n";
    out << std::string(5 + PARAMS_WIDTH + 65, '-') << "\n";
    std::size_t rank = 1;
    for (const SimulationResult& r : report.top) {
        const Metrics& m = r.metrics;
        out << std::left << std::setw(5) << rank++ << std::setw(PARAMS_WIDTH) << r.params_text << std::right
            << std::setw(10) << formatNumber(m.return_pct, 2)
            << std::setw(10) << formatNumber(m.mark_to_market_return_pct, 2)
            << std::setw(10) << formatNumber(m.max_drawdown_pct, 2)
            << std::setw(8) << m.num_trades
            << std::setw(8) << formatNumber(m.win_rate_pct, 1)
            << std::setw(8) << formatNumber(m.profit_factor, 2)
            << std::setw(5) << m.stop_loss_exits
            << std::setw(6) << (r.open_position ? "yes" : "-") << "\n";
    }
}

void Report::printOverfitChecks(std::ostream& out) const {
    if (result_.overfit_checks.empty()) return;
    out << "\n========== Overfitting check (train vs test) ==========\n";
    out << std::left << std::setw(14) << "Variant" << std::setw(PARAMS_WIDTH) << "Params" << std::right
        << std::setw(10) << "Train %" << std::setw(10) << "Test %" << std::setw(10) << "Diff" << "  Flag\n";
    for (const OverfitCheck& c : result_.overfit_checks) {
        out << std::left << std::setw(14) << c.variant << std::setw(PARAMS_WIDTH) << c.params_text << std::right
            << std::setw(10) << formatNumber(c.train_return_pct, 2)
            << std::setw(10) << formatNumber(c.test_return_pct, 2)
            << std::setw(10) << formatNumber(c.difference_pct, 2)
            << "  " << (c.suspect ? "SUSPECT" : "ok") << "\n";
    }
}

void Report::printComparison(std::ostream& out) const {
    if (result_.comparison.empty()) return;
    out << "\n========== Strategy comparison (best test parameters) ==========\n";
    out << std::left << std::setw(14) << "Variant" << std::setw(PARAMS_WIDTH) << "Params" << std::right
        << std::setw(10) << "Train %" << std::setw(10) << "Test %" << std::setw(10) << "MaxDD %"
        << std::setw(8) << "Trades" << std::setw(8) << "Win %" << "\n";
    for (const ComparisonRow& row : result_.comparison) {
        const Metrics& m = row.test.metrics;
        out << std::left << std::setw(14) << row.variant << std::setw(PARAMS_WIDTH) << row.test.params_text << std::right
            << std::setw(10) << (row.train_return_pct ? formatNumber(*row.train_return_pct, 2) : "-")
            << std::setw(10) << formatNumber(m.return_pct, 2)
            << std::setw(10) << formatNumber(m.max_drawdown_pct, 2)
            << std::setw(8) << m.num_trades
            << std::setw(8) << formatNumber(m.win_rate_pct, 1) << "\n";
        if (row.test.open_position) {
            out << "    open position " << formatNumber(m.open_quantity, 6)
                << " units, unrealized P&L " << formatNumber(m.unrealized_pnl, 2) << "\n";
        }
    }
}

void Report::printSummary(std::ostream& out) const {
    const std::ios::fmtflags saved_flags = out.flags();
    const std::streamsize saved_precision = out.precision();
    out << "\n========== Parameter Sweep Report ==========\n";
    printReportHeader(out);
    for (const RankedReport& r : result_.reports)
        printRankedReport(out, r);
    printOverfitChecks(out);
    printComparison(out);
    if (const SimulationResult* best = bestTestRun()) {
        out << "\nBest test run: " << best->variant << " (" << best->params_text << ") "
            << formatNumber(best->metrics.return_pct, 2) << "%\n";
    }
    out << "============================================\n\n";
    out.flags(saved_flags);
    out.precision(saved_precision);
}

const SimulationResult* Report::bestTestRun() const {
    const SimulationResult* best = nullptr;
    for (const ComparisonRow& row : result_.comparison) {
        if (!best || ranksBefore(row.test, *best))
            best = &row.test;
    }
    return best;
}

bool Report::writeResultsCsv(const std::string& filepath) const {
    std::ofstream f;
    if (!openForWriting(f, filepath)) return false;
    f << "variant,split,rank,params,return_pct,mtm_return_pct,max_drawdown_pct,num_trades,"
         "win_rate_pct,profit_factor,stop_loss_exits,skipped_buys,final_cash,open_quantity,unrealized_pnl\n";
    for (const RankedReport& report : result_.reports) {
        std::size_t rank = 1;
        for (const SimulationResult& r : report.top) {
            const Metrics& m = r.metrics;
            f << report.variant << ',' << toString(report.split) << ',' << rank++ << ',';
            writeCsvQuoted(f, r.params_text);
            f << ',' << formatNumber(m.return_pct, 4)
              << ',' << formatNumber(m.mark_to_market_return_pct, 4)
              << ',' << formatNumber(m.max_drawdown_pct, 4)
              << ',' << m.num_trades
              << ',' << formatNumber(m.win_rate_pct, 2)
              << ',' << formatNumber(m.profit_factor, 4)
              << ',' << m.stop_loss_exits
              << ',' << r.skipped_buys
              << ',' << formatNumber(r.final_cash, 2)
              << ',' << formatNumber(m.open_quantity, 8)
              << ',' << formatNumber(m.unrealized_pnl, 2) << "\n";
        }
    }
    if (!f) {
        std::cerr << "Failed to write sweep results: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeComparisonCsv(const std::string& filepath) const {
    std::ofstream f;
    if (!openForWriting(f, filepath)) return false;
    f << "variant,params,train_return_pct,test_return_pct,test_max_drawdown_pct,test_num_trades,"
         "test_win_rate_pct,test_profit_factor\n";
    for (const ComparisonRow& row : result_.comparison) {
        const Metrics& m = row.test.metrics;
        f << row.variant << ',';
        writeCsvQuoted(f, row.test.params_text);
        f << ',' << (row.train_return_pct ? formatNumber(*row.train_return_pct, 4) : "")
          << ',' << formatNumber(m.return_pct, 4)
          << ',' << formatNumber(m.max_drawdown_pct, 4)
          << ',' << m.num_trades
          << ',' << formatNumber(m.win_rate_pct, 2)
          << ',' << formatNumber(m.profit_factor, 4) << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write comparison: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f;
    if (!openForWriting(f, filepath)) return false;
    f << "bar_index,timestamp,action,reason,price,quantity,fee,notional,cash_after,units_after,pnl\n";
    if (const SimulationResult* best = bestTestRun()) {
        for (const Trade& t : best->trades) {
            f << t.bar_index << ',';
            writeCsvQuoted(f, t.timestamp);
            f << ',' << toString(t.action) << ',' << toString(t.reason)
              << ',' << formatNumber(t.price, 2)
              << ',' << formatNumber(t.quantity, 8)
              << ',' << formatNumber(t.fee, 4)
              << ',' << formatNumber(t.notional, 2)
              << ',' << formatNumber(t.cash_after, 2)
              << ',' << formatNumber(t.units_after, 8)
              << ',' << formatNumber(t.pnl, 2) << "\n";
        }
    }
    if (!f) {
        std::cerr << "Failed to write trade log: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    printSummary(f);
    return f ? true : (std::cerr << "Failed to write report: " << filepath << "\n", false);
}

} // namespace stratbench
