#pragma once

#include <stdexcept>
#include <string>

namespace peakrev {

// Invalid ratios, periods or policy names. Raised before any simulation runs.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error("configuration error: " + what) {}
};

// Internal inconsistency while realizing a proposal (malformed bar, bad level).
class SimulationFault : public std::runtime_error {
public:
    explicit SimulationFault(const std::string& what)
        : std::runtime_error("simulation fault: " + what) {}
};

class DataLoadError : public std::runtime_error {
public:
    explicit DataLoadError(const std::string& what)
        : std::runtime_error("data load error: " + what) {}
};

} // namespace peakrev
