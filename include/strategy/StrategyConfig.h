#pragma once

#include <string>

namespace peakrev {
namespace strategy {

enum class Timeframe { DAILY, WEEKLY };

Timeframe parseTimeframe(const std::string& name);
const char* toString(Timeframe timeframe);

struct PeakReversalConfig {
    std::string name = "peak_reversal";
    Timeframe timeframe = Timeframe::WEEKLY;

    // Peak detector windows (weekly preset)
    int recent_window = 5;
    int total_window = 52;
    int peak_ema_period = 15;
    double peak_ema_multiple = 1.2;     // peak high must reach 1.2x the EMA

    // Pattern classifier
    double pattern_buffer = 0.2;        // upper-wick tolerance, 0.1 daily / 0.2 weekly
    int max_pattern_bars = 7;

    // Entry EMA selected by the pattern tag
    int ema_fast_period = 15;           // "all" bearish
    int ema_slow_period = 33;           // "all_but_one" bearish

    int min_history_bars = 35;

    double tp_ratio = 0.10;
    double sl_ratio = 0.05;

    // Optional quality gate
    bool require_quality_gate = false;
    double min_risk_reward = 1.5;
    double min_volume_ratio = 0.5;

    // Symbol universe filter
    double min_market_cap = 150000000.0;
    double max_market_cap = 20000000000.0;
    std::string quote_asset = "USDT";

    static PeakReversalConfig weekly();
    static PeakReversalConfig daily();

    // Applies the timeframe's window and buffer preset
    void applyTimeframePreset(Timeframe tf);

    // Throws ConfigurationError
    void validate() const;
};

} // namespace strategy
} // namespace peakrev
