#include "strategy/StrategyConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace peakrev {
namespace strategy {

Timeframe parseTimeframe(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (normalized == "weekly" || normalized == "1w") {
        return Timeframe::WEEKLY;
    }
    if (normalized == "daily" || normalized == "1d") {
        return Timeframe::DAILY;
    }
    throw ConfigurationError("unknown timeframe '" + name + "'");
}

const char* toString(Timeframe timeframe) {
    return timeframe == Timeframe::WEEKLY ? "weekly" : "daily";
}

PeakReversalConfig PeakReversalConfig::weekly() {
    PeakReversalConfig cfg;
    cfg.applyTimeframePreset(Timeframe::WEEKLY);
    return cfg;
}

PeakReversalConfig PeakReversalConfig::daily() {
    PeakReversalConfig cfg;
    cfg.applyTimeframePreset(Timeframe::DAILY);
    return cfg;
}

void PeakReversalConfig::applyTimeframePreset(Timeframe tf) {
    timeframe = tf;
    if (tf == Timeframe::WEEKLY) {
        recent_window = 5;
        total_window = 52;
        pattern_buffer = 0.2;
    } else {
        recent_window = 7;
        total_window = 200;
        pattern_buffer = 0.1;
    }
}

void PeakReversalConfig::validate() const {
    if (!std::isfinite(tp_ratio) || tp_ratio <= 0.0) {
        throw ConfigurationError("tp_ratio must be > 0");
    }
    if (!std::isfinite(sl_ratio) || sl_ratio <= 0.0 || sl_ratio >= 1.0) {
        throw ConfigurationError("sl_ratio must be in (0, 1)");
    }
    if (ema_fast_period < 1 || ema_slow_period < 1 || peak_ema_period < 1) {
        throw ConfigurationError("EMA periods must be >= 1");
    }
    if (recent_window < 1 || total_window < recent_window) {
        throw ConfigurationError("require 1 <= recent_window <= total_window");
    }
    if (!std::isfinite(pattern_buffer) || pattern_buffer < 0.0) {
        throw ConfigurationError("pattern_buffer must be >= 0");
    }
    if (max_pattern_bars < 1) {
        throw ConfigurationError("max_pattern_bars must be >= 1");
    }
    if (!std::isfinite(peak_ema_multiple) || peak_ema_multiple <= 0.0) {
        throw ConfigurationError("peak_ema_multiple must be > 0");
    }
    if (min_history_bars < 1) {
        throw ConfigurationError("min_history_bars must be >= 1");
    }
    if (min_market_cap < 0.0 || max_market_cap < min_market_cap) {
        throw ConfigurationError("market cap range is inverted");
    }
}

} // namespace strategy
} // namespace peakrev
