#include "params.hpp"
#include <cmath>
#include <cstdio>

namespace stratbench {

ParamSet::ParamSet(std::initializer_list<std::pair<std::string, double>> values) {
    for (const auto& p : values) set(p.first, p.second);
}

void ParamSet::set(const std::string& name, double value) {
    for (auto& p : values_) {
        if (p.first == name) {
            p.second = value;
            return;
        }
    }
    values_.emplace_back(name, value);
}

std::optional<double> ParamSet::find(const std::string& name) const {
    for (const auto& p : values_)
        if (p.first == name) return p.second;
    return std::nullopt;
}

double ParamSet::get(const std::string& name, double fallback) const {
    auto v = find(name);
    return v ? *v : fallback;
}

std::string formatParamValue(double v) {
    char buf[32];
    if (std::floor(v) == v && std::abs(v) < 1e15)
        std::snprintf(buf, sizeof(buf), "%.0f", v);
    else
        std::snprintf(buf, sizeof(buf), "%.6g", v);
    return std::string(buf);
}

std::string ParamSet::toString() const {
    std::string s;
    for (const auto& p : values_) {
        if (!s.empty()) s += ' ';
        s += p.first + "=" + formatParamValue(p.second);
    }
    return s;
}

std::vector<ParamSet> expandGrid(const ParamGrid& grid) {
    std::vector<ParamSet> combos{ParamSet{}};
    for (const auto& axis : grid) {
        std::vector<ParamSet> next;
        next.reserve(combos.size() * axis.values.size());
        for (const auto& partial : combos) {
            for (double v : axis.values) {
                ParamSet p = partial;
                p.set(axis.name, v);
                next.push_back(std::move(p));
            }
        }
        combos = std::move(next);
    }
    return combos;
}

} // namespace stratbench
