#pragma once

#include "sweep.hpp"
#include <string>
#include <ostream>
#include <iostream>

namespace stratbench {

/// Console tables and files for a finished sweep.
class Report {
public:
    /// data_label is shown in the header (e.g. the CSV path).
    Report(const ParameterSweep& sweep, const SweepResult& result,
           const std::string& data_label = "");

    /// Ranked tables per (variant, split), the overfitting check and the comparison.
    void printSummary(std::ostream& out = std::cout) const;

    /// All ranked rows of all reports. Returns false and logs to stderr on failure.
    bool writeResultsCsv(const std::string& filepath) const;

    /// One row per variant: best test parameters with their train return.
    bool writeComparisonCsv(const std::string& filepath) const;

    /// Trade log of the best test run across variants. Writes only the header when there is none.
    bool writeTradeLog(const std::string& filepath) const;

    /// Same text as printSummary. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

    /// Best test-split run across all comparison rows, or nullptr when nothing ran.
    const SimulationResult* bestTestRun() const;

private:
    void printReportHeader(std::ostream& out) const;
    void printRankedReport(std::ostream& out, const RankedReport& report) const;
    void printOverfitChecks(std::ostream& out) const;
    void printComparison(std::ostream& out) const;

    const ParameterSweep& sweep_;
    const SweepResult& result_;
    std::string data_label_;
};

} // namespace stratbench
