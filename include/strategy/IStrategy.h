#pragma once

#include "common/Types.h"
#include "analytics/PatternClassifier.h"
#include <string>
#include <vector>

namespace peakrev {
namespace strategy {

enum class SignalType {
    NONE,
    BUY
};

// Furthest stage reached by a scan
enum class ScanStage {
    SCANNING,
    PEAK_FOUND,
    PATTERN_CONFIRMED,
    SIGNAL_EMITTED,
    NO_SIGNAL
};

enum class SignalStrength { WEAK, MODERATE, STRONG };

const char* toString(SignalType type);
const char* toString(ScanStage stage);
const char* toString(SignalStrength strength);

// Per-scan decision record
struct Decision {
    SignalType signal;
    ScanStage stage;                    // SIGNAL_EMITTED or NO_SIGNAL
    ScanStage last_passed;              // furthest stage passed before stopping
    std::string symbol;
    std::string strategy_name;
    Direction direction;

    double entry_price;
    double tp_price;
    double sl_price;
    int ema_period_used;

    long long peak_index;               // -1 when no peak
    double peak_price;
    analytics::PatternTag pattern;

    // Quality metadata (BUY only)
    double current_price;
    double volume_ratio;
    double risk_reward;
    SignalStrength strength;

    std::string reason;
    long long timestamp;                // timestamp of the evaluated bar

    Decision()
        : signal(SignalType::NONE)
        , stage(ScanStage::NO_SIGNAL)
        , last_passed(ScanStage::SCANNING)
        , direction(Direction::LONG)
        , entry_price(0.0)
        , tp_price(0.0)
        , sl_price(0.0)
        , ema_period_used(0)
        , peak_index(-1)
        , peak_price(0.0)
        , pattern(analytics::PatternTag::NONE)
        , current_price(0.0)
        , volume_ratio(1.0)
        , risk_reward(0.0)
        , strength(SignalStrength::WEAK)
        , timestamp(0)
    {}

    bool isBuy() const { return signal == SignalType::BUY; }
};

// Entry in the tradable universe before filtering
struct SymbolInfo {
    std::string symbol;             // base ticker ("ETH") or full pair ("ETHUSDT")
    double market_cap = 0.0;
};

// Capability interface implemented by every strategy variant
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual std::string name() const = 0;

    // Pure function of the candle window (oldest first) and configuration
    virtual Decision decide(const std::string& symbol, const std::vector<Candle>& candles) const = 0;

    // Bars of history needed before decide() can emit anything
    virtual int requiredLookback() const = 0;

    // Tradable pair symbols accepted from the universe
    virtual std::vector<std::string> filterSymbols(const std::vector<SymbolInfo>& universe) const = 0;
};

} // namespace strategy
} // namespace peakrev
