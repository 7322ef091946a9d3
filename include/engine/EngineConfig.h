#pragma once

#include <string>
#include <cstdint>

namespace peakrev {
namespace engine {

// Tie-break when TP and SL are both touched inside one bar
enum class CrossingPolicy {
    PREFER_SL,      // conservative (default)
    PREFER_TP,      // optimistic
    RANDOM          // uniform draw from the injected random source
};

CrossingPolicy parseCrossingPolicy(const std::string& name);
const char* toString(CrossingPolicy policy);

// Execution and portfolio settings for one backtest run
struct EngineConfig {
    double initial_cash = 10000.0;
    int max_positions = 1;

    double fee = 0.001;                 // per entry fill, fraction
    double slippage = 0.0005;           // per entry fill, fraction
    int execution_delay_bars = 0;       // bars after the signal before the entry fill
    CrossingPolicy crossing_policy = CrossingPolicy::PREFER_SL;
    std::uint64_t random_seed = 42;

    double add_buy_pct = 0.0;           // DCA lot size as a fraction of the primary lot
    double position_size_ratio = 0.5;   // fraction of cash committed per new trade
    bool close_open_at_end = true;      // close leftover lots at the last close (exit type CLOSE)

    // Throws ConfigurationError
    void validate() const;
};

} // namespace engine
} // namespace peakrev
