#include "strategy/PeakReversalStrategy.h"
#include "strategy/StrategyManager.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

using namespace peakrev;
using namespace peakrev::strategy;

namespace {

constexpr long long WEEK_MS = 7LL * 24 * 60 * 60 * 1000;
constexpr long long START_MS = 1704067200000LL;

bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

void addBar(std::vector<Candle>& bars, double o, double h, double l, double c) {
    const long long ts = START_MS + static_cast<long long>(bars.size()) * WEEK_MS;
    bars.emplace_back(o, h, l, c, 1000.0, ts);
}

// Flat base, breakout, peak at index 33, then four lower red bars
std::vector<Candle> reversalSeries() {
    std::vector<Candle> bars;
    for (int i = 0; i < 32; ++i) addBar(bars, 100.0, 101.0, 99.0, 100.0);
    addBar(bars, 100.0, 125.0, 100.0, 124.0);
    addBar(bars, 124.0, 140.0, 123.0, 138.0);
    for (int k = 0; k < 4; ++k) {
        const double open = 134.0 - 6.0 * k;
        const double close = open - 5.0;
        addBar(bars, open, open + 1.0, close - 1.0, close);
    }
    return bars;
}

} // namespace

int main() {
    PeakReversalStrategy strategy(PeakReversalConfig::weekly());
    assert(strategy.requiredLookback() == 35);
    assert(strategy.name() == "peak_reversal");

    // BUY on the pullback into EMA15
    {
        const auto bars = reversalSeries();
        const auto d = strategy.decide("BTCUSDT", bars);
        assert(d.isBuy());
        assert(d.stage == ScanStage::SIGNAL_EMITTED);
        assert(d.pattern == analytics::PatternTag::ALL);
        assert(d.ema_period_used == 15);
        assert(d.peak_index == 33);
        assert(near(d.peak_price, 140.0));
        assert(near(d.entry_price, 112.18710327148438));
        assert(near(d.tp_price, d.entry_price * 1.1));
        assert(near(d.sl_price, d.entry_price * 0.95));
        assert(near(d.risk_reward, 2.0));
        assert(d.direction == Direction::LONG);
        assert(d.timestamp == bars.back().timestamp);
        assert(d.reason == "pattern_all");

        // Same input, same decision
        const auto again = strategy.decide("BTCUSDT", bars);
        assert(again.isBuy() && again.entry_price == d.entry_price);
    }

    // One bar earlier the low still sits above the EMA
    {
        auto bars = reversalSeries();
        bars.pop_back();
        const auto d = strategy.decide("BTCUSDT", bars);
        assert(!d.isBuy());
        assert(d.reason == "low_above_ema");
        assert(d.last_passed == ScanStage::PATTERN_CONFIRMED);
    }

    // Too little history
    {
        auto bars = reversalSeries();
        bars.resize(20);
        const auto d = strategy.decide("BTCUSDT", bars);
        assert(!d.isBuy());
        assert(d.reason == "insufficient_history");
        assert(d.last_passed == ScanStage::SCANNING);
    }

    // Flat series: every high ties
    {
        std::vector<Candle> bars;
        for (int i = 0; i < 40; ++i) addBar(bars, 100.0, 101.0, 99.0, 100.0);
        const auto d = strategy.decide("BTCUSDT", bars);
        assert(!d.isBuy());
        assert(d.reason == "no_peak:tied_maximum");
        assert(d.peak_index == -1);
    }

    // Two green bars after the peak
    {
        auto bars = reversalSeries();
        bars[34].close = 134.0;
        bars[34].open = 129.0;
        bars[34].low = 128.0;
        bars[35].close = 128.0;
        bars[35].open = 123.0;
        bars[35].low = 122.0;
        const auto d = strategy.decide("BTCUSDT", bars);
        assert(!d.isBuy());
        assert(d.reason == "pattern_none");
        assert(d.last_passed == ScanStage::PEAK_FOUND);
        assert(d.peak_index == 33);
    }

    // Bad configuration
    {
        auto cfg = PeakReversalConfig::weekly();
        cfg.sl_ratio = 1.5;
        bool threw = false;
        try {
            PeakReversalStrategy bad(cfg);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // Quality gate
    {
        Decision d;
        d.signal = SignalType::BUY;
        d.risk_reward = 2.0;
        d.strength = SignalStrength::MODERATE;
        d.volume_ratio = 1.0;
        assert(strategy.passesQualityGate(d));

        Decision weak = d;
        weak.strength = SignalStrength::WEAK;
        assert(!strategy.passesQualityGate(weak));

        Decision poor_rr = d;
        poor_rr.risk_reward = 1.0;
        assert(!strategy.passesQualityGate(poor_rr));

        Decision thin = d;
        thin.volume_ratio = 0.2;
        assert(!strategy.passesQualityGate(thin));

        assert(!strategy.passesQualityGate(Decision()));
    }

    // Universe filter
    {
        std::vector<SymbolInfo> universe{
            {"eth", 5.0e8},
            {"ETHUSDT", 6.0e8},
            {"doge", 1.0e8},
            {"btc", 1.0e12},
            {" sol ", 2.0e9},
            {"", 1.0e9},
        };
        const auto pairs = strategy.filterSymbols(universe);
        assert(pairs.size() == 2);
        assert(pairs[0] == "ETHUSDT");
        assert(pairs[1] == "SOLUSDT");
    }

    // Ensemble
    {
        Decision a;
        a.signal = SignalType::BUY;
        a.strategy_name = "a";
        a.risk_reward = 2.0;
        a.entry_price = 10.0;
        Decision b = a;
        b.strategy_name = "b";
        b.risk_reward = 3.0;
        b.entry_price = 11.0;
        Decision none;
        none.strategy_name = "c";

        const auto best = aggregateDecisions({a, none, b});
        assert(best.isBuy());
        assert(best.entry_price == 11.0);
        assert(best.reason == "b (2 votes)");

        const auto short_of_votes = aggregateDecisions({a, none, b}, 3);
        assert(!short_of_votes.isBuy());
        assert(short_of_votes.reason == "no_consensus");

        assert(!aggregateDecisions({}).isBuy());
    }

    // Manager
    {
        StrategyManager manager;
        manager.registerStrategy(std::make_shared<PeakReversalStrategy>(PeakReversalConfig::weekly()));
        manager.registerStrategy(nullptr);
        assert(manager.getStrategies().size() == 1);
        assert(manager.getStrategy("peak_reversal") != nullptr);
        assert(manager.getStrategy("missing") == nullptr);
        assert(manager.requiredLookback() == 35);

        const auto decisions = manager.collectDecisions("BTCUSDT", reversalSeries());
        assert(decisions.size() == 1);
        const auto merged = aggregateDecisions(decisions);
        assert(merged.isBuy());
        assert(merged.ema_period_used == 15);
    }

    std::cout << "[TEST] SignalEngine PASSED\n";
    return 0;
}
