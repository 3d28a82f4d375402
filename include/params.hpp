#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stratbench {

/// One concrete parameter combination, in grid-axis order (e.g. short=10 long=50).
class ParamSet {
public:
    ParamSet() = default;
    ParamSet(std::initializer_list<std::pair<std::string, double>> values);

    void set(const std::string& name, double value);
    std::optional<double> find(const std::string& name) const;
    /// Value or `fallback` when the parameter is absent.
    double get(const std::string& name, double fallback) const;

    const std::vector<std::pair<std::string, double>>& values() const { return values_; }
    bool empty() const { return values_.empty(); }

    /// "short=10 long=50"
    std::string toString() const;

    bool operator==(const ParamSet& o) const { return values_ == o.values_; }
    bool operator!=(const ParamSet& o) const { return !(*this == o); }

private:
    std::vector<std::pair<std::string, double>> values_;
};

/// One grid dimension: parameter name and the values to try.
struct ParamAxis {
    std::string name;
    std::vector<double> values;
};

using ParamGrid = std::vector<ParamAxis>;

/// Full cross-product of the grid. The last axis varies fastest.
/// An empty grid yields a single empty ParamSet; an axis without values yields nothing.
std::vector<ParamSet> expandGrid(const ParamGrid& grid);

/// Format a parameter value: integers without decimals, others with up to 6 significant digits.
std::string formatParamValue(double v);

} // namespace stratbench
