#pragma once

#include "bar.hpp"
#include <vector>

namespace stratbench {

class IndicatorCache;

class IContext {
public:
    virtual ~IContext() = default;

    /// Index of the bar being processed (0-based).
    virtual std::size_t barIndex() const = 0;

    /// Bars of the simulated window. Strategies must not read past barIndex().
    virtual const std::vector<Bar>& bars() const = 0;

    /// Indicator series for this window. Every value at index i uses bars <= i only.
    virtual IndicatorCache& indicators() const = 0;
};

} // namespace stratbench
