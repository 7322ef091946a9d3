#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <string>
#include <vector>

namespace peakrev {
namespace strategy {

// Long-only reversal entry after a confirmed breakout peak.
//
// SCANNING -> PEAK_FOUND -> PATTERN_CONFIRMED -> SIGNAL_EMITTED, falling back to
// NO_SIGNAL at any stage. The pattern tag picks the entry EMA (fast for "all",
// slow for "all_but_one"); a BUY fires when the current low trades under it.
class PeakReversalStrategy : public IStrategy {
public:
    // Throws ConfigurationError
    explicit PeakReversalStrategy(PeakReversalConfig config);

    std::string name() const override { return config_.name; }
    Decision decide(const std::string& symbol, const std::vector<Candle>& candles) const override;
    int requiredLookback() const override;
    std::vector<std::string> filterSymbols(const std::vector<SymbolInfo>& universe) const override;

    // Risk/reward, strength and volume floor; never applied inside decide()
    bool passesQualityGate(const Decision& decision) const;

    const PeakReversalConfig& config() const { return config_; }

    static SignalStrength calculateSignalStrength(
        const std::vector<Candle>& candles,
        double peak_price,
        double current_price,
        double volume_ratio
    );
    static double calculateVolumeRatio(const std::vector<Candle>& candles, int lookback = 20);

private:
    std::string normalizePair(const std::string& symbol) const;

    PeakReversalConfig config_;
};

} // namespace strategy
} // namespace peakrev
