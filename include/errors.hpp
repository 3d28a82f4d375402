#pragma once

#include <stdexcept>
#include <string>

namespace stratbench {

/// Invalid static configuration (periods, thresholds, capital, splits).
/// Raised before any simulation run starts.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace stratbench
