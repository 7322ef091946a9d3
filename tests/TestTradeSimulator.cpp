#include "backtest/TradeSimulator.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace peakrev;
using namespace peakrev::backtest;
using engine::CrossingPolicy;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

class FixedRandomSource : public IRandomSource {
public:
    explicit FixedRandomSource(double value) : value_(value) {}
    double nextUniform() override {
        ++draws;
        return value_;
    }
    int draws = 0;

private:
    double value_;
};

std::shared_ptr<const std::vector<Candle>> makeCandles(const std::vector<std::vector<double>>& ohlc) {
    auto bars = std::make_shared<std::vector<Candle>>();
    long long ts = 1000;
    for (const auto& b : ohlc) {
        bars->emplace_back(b[0], b[1], b[2], b[3], 1.0, ts);
        ts += 1000;
    }
    return bars;
}

TradeMeta longMeta(double entry, double tp, double sl, double size = 1.0) {
    TradeMeta meta;
    meta.symbol = "BTCUSDT";
    meta.entry_price = entry;
    meta.tp_price = tp;
    meta.sl_price = sl;
    meta.size = size;
    meta.direction = Direction::LONG;
    return meta;
}

// Signal bar, then one bar that touches both 94 and 112
TradeProposal crossingProposal() {
    auto candles = makeCandles({{100, 101, 99, 100}, {99, 112, 94, 108}});
    return TradeProposal(longMeta(100.0, 110.0, 95.0), candles, 0);
}

template <typename Fn>
bool throwsFault(Fn fn) {
    try {
        fn();
    } catch (const SimulationFault&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    // Crossing resolved toward TP
    {
        const auto proposal = crossingProposal();
        auto out = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_TP, nullptr);
        assert(out && out->closed);
        assert(out->crossing);
        assert(out->exit_type == ExitType::TP);
        assert(near(out->exit_price, 110.0));
        assert(near(out->return_pct, 10.0));
        assert(out->result == TradeResult::WIN);
        assert(*out->exit_bar_index == 1);
        assert(out->fills.size() == 2);
        assert(out->fills[0].kind == FillKind::ENTRY);
        assert(near(out->fills[0].price, 99.0));       // better open than the plan
        assert(out->fills[1].kind == FillKind::EXIT && out->fills[1].crossing);
    }

    // Same bar resolved toward SL
    {
        const auto proposal = crossingProposal();
        auto out = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr);
        assert(out && out->closed);
        assert(out->exit_type == ExitType::SL);
        assert(near(out->exit_price, 95.0));
        assert(near(out->return_pct, -5.0));
        assert(out->result == TradeResult::LOSS);

        // A source that would pick TP is never consulted
        FixedRandomSource rng(0.0);
        auto seeded = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, &rng);
        assert(seeded->crossing);
        assert(seeded->exit_type == ExitType::SL);
        assert(rng.draws == 0);
    }

    // Random policy draws once per crossing
    {
        const auto proposal = crossingProposal();
        FixedRandomSource low(0.3);
        auto tp = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::RANDOM, &low);
        assert(tp->exit_type == ExitType::TP);
        assert(low.draws == 1);

        FixedRandomSource high(0.7);
        auto sl = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::RANDOM, &high);
        assert(sl->exit_type == ExitType::SL);

        assert(throwsFault([&] {
            realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::RANDOM, nullptr);
        }));
    }

    // Seeded sources replay the same draws
    {
        SeededRandomSource a(7);
        SeededRandomSource b(7);
        for (int i = 0; i < 16; ++i) {
            const double u = a.nextUniform();
            assert(u >= 0.0 && u < 1.0);
            assert(u == b.nextUniform());
        }
    }

    // No draw without a crossing
    {
        auto candles = makeCandles({{100, 101, 99, 100}, {100, 111, 99, 110}});
        TradeProposal proposal(longMeta(100.0, 110.0, 95.0), candles, 0);
        FixedRandomSource rng(0.9);
        auto out = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::RANDOM, &rng);
        assert(out->exit_type == ExitType::TP);
        assert(!out->crossing);
        assert(rng.draws == 0);
    }

    // Entry costs
    {
        auto candles = makeCandles({{100, 101, 99, 100}, {101, 111, 99, 110}});
        TradeProposal proposal(longMeta(100.0, 110.0, 95.0), candles, 0);
        auto out = realize(proposal, 0.0, 0.001, 0.0005, 0, CrossingPolicy::PREFER_SL, nullptr);
        assert(near(out->fills[0].price, 100.0 * 1.0005 * 1.001));
        assert(near(out->return_pct, 10.0));
    }

    // Entry bar beyond the data
    {
        const auto proposal = crossingProposal();
        assert(!realize(proposal, 0.0, 0.0, 0.0, 1, CrossingPolicy::PREFER_SL, nullptr));

        auto candles = makeCandles({{100, 101, 99, 100}});
        TradeProposal last(longMeta(100.0, 110.0, 95.0), candles, 0);
        assert(last.forwardSize() == 0);
        assert(!realize(last, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr));
    }

    // Execution delay shifts the entry bar
    {
        auto candles = makeCandles({{100, 101, 99, 100}, {100, 101, 99, 100}, {98, 111, 97, 110}});
        TradeProposal proposal(longMeta(100.0, 110.0, 95.0), candles, 0);
        auto out = realize(proposal, 0.0, 0.0, 0.0, 1, CrossingPolicy::PREFER_SL, nullptr);
        assert(out->fills[0].bar_index == 2);
        assert(near(out->fills[0].price, 98.0));
        assert(*out->exit_bar_index == 2);
    }

    // Averaging down, then both lots exit at TP
    {
        auto candles = makeCandles({
            {100, 101, 99, 100},
            {100, 101, 96, 97},
            {97, 98, 94, 95},
            {95, 111, 94, 110},
        });
        TradeProposal proposal(longMeta(100.0, 110.0, 90.0, 2.0), candles, 0);
        auto out = realize(proposal, 0.5, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr);
        assert(out && out->closed);
        assert(out->dca_used);
        assert(out->fills.size() == 4);
        assert(out->fills[1].kind == FillKind::ADD);
        assert(out->fills[1].lot == 1);
        assert(out->fills[1].bar_index == 2);
        assert(near(out->fills[1].price, 95.0));
        assert(near(out->fills[1].size, 1.0));
        assert(out->fills[2].kind == FillKind::EXIT && out->fills[2].lot == 0);
        assert(out->fills[3].kind == FillKind::EXIT && out->fills[3].lot == 1);
        assert(near(out->fills[2].price, 110.0) && near(out->fills[3].price, 110.0));
        assert(near(out->fills[3].size, 1.0));

        // Without add_buy_pct the trigger is ignored
        auto plain = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr);
        assert(!plain->dca_used);
        assert(plain->fills.size() == 2);
    }

    // Short trade
    {
        auto candles = makeCandles({{100, 101, 99, 100}, {101, 102, 95, 96}, {96, 97, 89, 90}});
        TradeMeta meta = longMeta(100.0, 90.0, 105.0);
        meta.direction = Direction::SHORT;
        TradeProposal proposal(meta, candles, 0);
        auto out = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr);
        assert(near(out->fills[0].price, 101.0));
        assert(out->exit_type == ExitType::TP);
        assert(near(out->exit_price, 90.0));
        assert(near(out->return_pct, 10.0));
        assert(out->result == TradeResult::WIN);
    }

    // Data runs out with the lot still open
    {
        auto candles = makeCandles({{100, 101, 99, 100}, {100, 102, 97, 101}, {101, 103, 98, 102}});
        TradeProposal proposal(longMeta(100.0, 110.0, 95.0), candles, 0);
        auto out = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr);
        assert(out);
        assert(!out->closed);
        assert(!out->exit_bar_index);
        assert(out->fills.size() == 1);
    }

    // Malformed bars and levels
    {
        auto bad_bar = makeCandles({{100, 101, 99, 100}, {100, 101, 99, 100}, {100, 98, 102, 100}});
        TradeProposal p1(longMeta(100.0, 110.0, 95.0), bad_bar, 0);
        assert(throwsFault([&] { realize(p1, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr); }));

        auto nan_bar = makeCandles({{100, 101, 99, 100}, {std::nan(""), 101, 99, 100}});
        TradeProposal p2(longMeta(100.0, 110.0, 95.0), nan_bar, 0);
        assert(throwsFault([&] { realize(p2, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr); }));

        auto ok = makeCandles({{100, 101, 99, 100}, {100, 101, 99, 100}});
        TradeProposal inverted(longMeta(100.0, 95.0, 110.0), ok, 0);
        assert(throwsFault([&] { realize(inverted, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr); }));

        TradeProposal zero_size(longMeta(100.0, 110.0, 95.0, 0.0), ok, 0);
        assert(throwsFault([&] { realize(zero_size, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_SL, nullptr); }));

        TradeProposal fine(longMeta(100.0, 110.0, 95.0), ok, 0);
        assert(throwsFault([&] { realize(fine, 0.0, 0.0, 0.0, -1, CrossingPolicy::PREFER_SL, nullptr); }));

        assert(throwsFault([&] { TradeProposal(longMeta(100.0, 110.0, 95.0), ok, 5); }));
        assert(throwsFault([&] { TradeProposal(longMeta(100.0, 110.0, 95.0), nullptr, 0); }));
    }

    // A failing analytics hook does not change the outcome
    {
        const auto proposal = crossingProposal();
        int calls = 0;
        AnalyticsHook hook = [&calls](const Fill&) {
            ++calls;
            throw std::runtime_error("hook failure");
        };
        auto out = realize(proposal, 0.0, 0.0, 0.0, 0, CrossingPolicy::PREFER_TP, nullptr, hook);
        assert(out && out->closed);
        assert(calls == 2);
        assert(out->exit_type == ExitType::TP);
    }

    // Proposal ids are unique
    {
        const auto a = crossingProposal();
        const auto b = crossingProposal();
        assert(a.id() != b.id());
    }

    // Bound simulator
    {
        engine::EngineConfig cfg;
        cfg.fee = 0.0;
        cfg.slippage = 0.0;
        cfg.crossing_policy = CrossingPolicy::RANDOM;
        cfg.random_seed = 11;
        TradeSimulator sim(cfg);
        const auto proposal = crossingProposal();
        auto first = sim.realize(proposal, 0.0);
        assert(first && first->crossing);

        TradeSimulator replay(cfg);
        auto second = replay.realize(proposal, 0.0);
        assert(second->exit_type == first->exit_type);

        auto fixed = std::make_shared<FixedRandomSource>(0.1);
        TradeSimulator injected(cfg, fixed);
        assert(injected.realize(proposal, 0.0)->exit_type == ExitType::TP);
        assert(fixed->draws == 1);

        engine::EngineConfig stop_first = cfg;
        stop_first.crossing_policy = CrossingPolicy::PREFER_SL;
        auto unused = std::make_shared<FixedRandomSource>(0.0);
        TradeSimulator pessimistic(stop_first, unused);
        assert(pessimistic.realize(proposal, 0.0)->exit_type == ExitType::SL);
        assert(unused->draws == 0);

        engine::EngineConfig bad = cfg;
        bad.max_positions = 0;
        bool threw = false;
        try {
            TradeSimulator rejected(bad);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] TradeSimulator PASSED\n";
    return 0;
}
