#include "strategy/StrategyManager.h"
#include "common/Logger.h"
#include <algorithm>

namespace peakrev {
namespace strategy {

void StrategyManager::registerStrategy(std::shared_ptr<const IStrategy> strategy) {
    if (!strategy) {
        return;
    }
    LOG_INFO("Strategy registered: {}", strategy->name());
    strategies_.push_back(std::move(strategy));
}

std::shared_ptr<const IStrategy> StrategyManager::getStrategy(const std::string& name) const {
    for (const auto& s : strategies_) {
        if (s->name() == name) {
            return s;
        }
    }
    return nullptr;
}

std::vector<Decision> StrategyManager::collectDecisions(
    const std::string& symbol,
    const std::vector<Candle>& candles
) const {
    std::vector<Decision> decisions;
    decisions.reserve(strategies_.size());
    for (const auto& s : strategies_) {
        decisions.push_back(s->decide(symbol, candles));
    }
    return decisions;
}

int StrategyManager::requiredLookback() const {
    int lookback = 0;
    for (const auto& s : strategies_) {
        lookback = std::max(lookback, s->requiredLookback());
    }
    return lookback;
}

Decision aggregateDecisions(const std::vector<Decision>& decisions, int min_votes) {
    const Decision* best = nullptr;
    int votes = 0;
    for (const auto& d : decisions) {
        if (!d.isBuy()) continue;
        ++votes;
        if (best == nullptr || d.risk_reward > best->risk_reward) {
            best = &d;
        }
    }

    if (best == nullptr || votes < std::max(min_votes, 1)) {
        Decision none;
        if (!decisions.empty()) {
            none.symbol = decisions.front().symbol;
            none.timestamp = decisions.front().timestamp;
            none.current_price = decisions.front().current_price;
        }
        none.strategy_name = "ensemble";
        none.reason = "no_consensus";
        return none;
    }

    Decision out = *best;
    out.reason = best->strategy_name + " (" + std::to_string(votes) + " votes)";
    return out;
}

} // namespace strategy
} // namespace peakrev
