#include "engine/EngineConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace peakrev {
namespace engine {

namespace {
std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

bool isFraction(double v) {
    return std::isfinite(v) && v >= 0.0 && v < 1.0;
}
} // namespace

CrossingPolicy parseCrossingPolicy(const std::string& name) {
    const std::string normalized = normalizeName(name);
    if (normalized == "prefer_sl" || normalized == "sl") {
        return CrossingPolicy::PREFER_SL;
    }
    if (normalized == "prefer_tp" || normalized == "tp") {
        return CrossingPolicy::PREFER_TP;
    }
    if (normalized == "random") {
        return CrossingPolicy::RANDOM;
    }
    throw ConfigurationError("unknown crossing_policy '" + name + "'");
}

const char* toString(CrossingPolicy policy) {
    switch (policy) {
        case CrossingPolicy::PREFER_TP: return "prefer_tp";
        case CrossingPolicy::RANDOM: return "random";
        default: return "prefer_sl";
    }
}

void EngineConfig::validate() const {
    if (!std::isfinite(initial_cash) || initial_cash < 0.0) {
        throw ConfigurationError("initial_cash must be >= 0");
    }
    if (max_positions < 1) {
        throw ConfigurationError("max_positions must be >= 1");
    }
    if (!isFraction(fee)) {
        throw ConfigurationError("fee must be in [0, 1)");
    }
    if (!isFraction(slippage)) {
        throw ConfigurationError("slippage must be in [0, 1)");
    }
    if (execution_delay_bars < 0) {
        throw ConfigurationError("execution_delay_bars must be >= 0");
    }
    if (!std::isfinite(add_buy_pct) || add_buy_pct < 0.0) {
        throw ConfigurationError("add_buy_pct must be >= 0");
    }
    if (!std::isfinite(position_size_ratio) || position_size_ratio <= 0.0 || position_size_ratio > 1.0) {
        throw ConfigurationError("position_size_ratio must be in (0, 1]");
    }
}

} // namespace engine
} // namespace peakrev
