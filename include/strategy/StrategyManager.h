#pragma once

#include "strategy/IStrategy.h"
#include <vector>
#include <memory>
#include <string>

namespace peakrev {
namespace strategy {

// Holds independent strategy objects and evaluates them side by side.
class StrategyManager {
public:
    StrategyManager() = default;

    void registerStrategy(std::shared_ptr<const IStrategy> strategy);
    std::shared_ptr<const IStrategy> getStrategy(const std::string& name) const;
    const std::vector<std::shared_ptr<const IStrategy>>& getStrategies() const { return strategies_; }

    // One decision per registered strategy, in registration order
    std::vector<Decision> collectDecisions(
        const std::string& symbol,
        const std::vector<Candle>& candles
    ) const;

    // Largest lookback across strategies
    int requiredLookback() const;

private:
    std::vector<std::shared_ptr<const IStrategy>> strategies_;
};

// Ensemble rule: BUY when at least `min_votes` decisions are BUY; the BUY with the
// best risk/reward (first on ties) carries the levels.
Decision aggregateDecisions(const std::vector<Decision>& decisions, int min_votes = 1);

} // namespace strategy
} // namespace peakrev
