#include "backtest/BacktestEngine.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

using namespace peakrev;
using peakrev::backtest::BacktestEngine;

namespace {

constexpr long long WEEK_MS = 7LL * 24 * 60 * 60 * 1000;
constexpr long long START_MS = 1704067200000LL;

void addBar(std::vector<Candle>& bars, double o, double h, double l, double c) {
    const long long ts = START_MS + static_cast<long long>(bars.size()) * WEEK_MS;
    bars.emplace_back(o, h, l, c, 1000.0, ts);
}

// Signal on bar 37, entry on bar 38, take-profit on bar 39
std::vector<Candle> tradeSeries() {
    std::vector<Candle> bars;
    for (int i = 0; i < 32; ++i) addBar(bars, 100.0, 101.0, 99.0, 100.0);
    addBar(bars, 100.0, 125.0, 100.0, 124.0);
    addBar(bars, 124.0, 140.0, 123.0, 138.0);
    for (int k = 0; k < 4; ++k) {
        const double open = 134.0 - 6.0 * k;
        addBar(bars, open, open + 1.0, open - 6.0, open - 5.0);
    }
    addBar(bars, 111.0, 115.0, 109.0, 114.0);
    addBar(bars, 114.0, 125.0, 113.0, 124.0);
    return bars;
}

// Same signal, but the fill sits under water for five bars before the take-profit
std::vector<Candle> underwaterSeries() {
    auto bars = tradeSeries();
    bars.resize(38);
    addBar(bars, 111.0, 112.0, 107.0, 107.5);
    for (int k = 0; k < 4; ++k) addBar(bars, 107.5, 108.5, 107.0, 107.2);
    addBar(bars, 107.2, 125.0, 107.0, 124.0);
    return bars;
}

engine::EngineConfig zeroCostConfig() {
    engine::EngineConfig cfg;
    cfg.initial_cash = 10000.0;
    cfg.fee = 0.0;
    cfg.slippage = 0.0;
    return cfg;
}

} // namespace

int main() {
    // Full run: one signal, one take-profit
    {
        BacktestEngine bt;
        bt.init(zeroCostConfig(), strategy::PeakReversalConfig::weekly());
        bt.setData(tradeSeries());
        bt.run();

        const auto result = bt.getResult();
        assert(result.signals_generated == 1);
        assert(result.proposals_executed == 1);
        assert(result.proposals_rejected == 0);
        assert(result.total_trades == 1);
        assert(result.winning_trades == 1);
        assert(result.losing_trades == 0);
        assert(result.exit_reason_counts.at("TP") == 1);
        assert(result.intrabar_collision_count == 0);
        assert(result.win_rate == 1.0);
        assert(result.final_equity > result.initial_cash);
        assert(std::fabs(result.final_equity - 10552.907296688625) < 1e-6);
        assert(std::fabs(result.total_return_pct - (result.final_equity - 10000.0) / 100.0) < 1e-9);

        const auto& signal = bt.signals().front();
        assert(signal.peak_index == 33);
        assert(signal.timestamp == bt.data()[37].timestamp);

        const auto& trade = bt.portfolio().tradeLog().front();
        assert(trade.entry_price == 111.0);
        assert(trade.entry_time == bt.data()[38].timestamp);
        assert(trade.exit_time == bt.data()[39].timestamp);
        assert(bt.portfolio().openLotCount() == 0);

        // Equity curve is time ordered and ends at the exit
        const auto& curve = bt.portfolio().equityCurve();
        for (std::size_t i = 1; i < curve.size(); ++i) {
            assert(curve[i].time >= curve[i - 1].time);
        }
        assert(curve.size() == bt.data().size());
        assert(curve.back().time == bt.data().back().timestamp);
        assert(result.max_drawdown == 0.0);
    }

    // Every held bar is marked, so an open loss shows up as drawdown
    {
        BacktestEngine bt;
        bt.init(zeroCostConfig(), strategy::PeakReversalConfig::weekly());
        bt.setData(underwaterSeries());
        bt.run();

        const auto result = bt.getResult();
        assert(result.total_trades == 1);
        assert(result.exit_reason_counts.at("TP") == 1);
        assert(result.final_equity > result.initial_cash);
        assert(result.max_drawdown > 0.01);

        const auto& curve = bt.portfolio().equityCurve();
        assert(curve.size() == bt.data().size());
        for (std::size_t i = 0; i < curve.size(); ++i) {
            assert(curve[i].time == bt.data()[i].timestamp);
        }
        assert(curve[40].equity < result.initial_cash);
        assert(bt.portfolio().tradeLog().front().exit_time == bt.data().back().timestamp);
    }

    // Quality gate turns the weak signal away
    {
        auto strategy_cfg = strategy::PeakReversalConfig::weekly();
        strategy_cfg.require_quality_gate = true;
        BacktestEngine bt;
        bt.init(zeroCostConfig(), strategy_cfg);
        bt.setData(tradeSeries());
        bt.run();

        const auto result = bt.getResult();
        assert(result.signals_generated == 1);
        assert(result.quality_gate_rejected == 1);
        assert(result.total_trades == 0);
        assert(result.final_equity == 10000.0);
    }

    // Data ends while the lot is open
    {
        auto bars = tradeSeries();
        bars.pop_back();

        BacktestEngine bt;
        bt.init(zeroCostConfig(), strategy::PeakReversalConfig::weekly());
        bt.setData(bars);
        bt.run();
        const auto result = bt.getResult();
        assert(result.total_trades == 1);
        assert(result.exit_reason_counts.at("CLOSE") == 1);
        assert(bt.portfolio().tradeLog().front().exit_price == 114.0);

        auto keep_open = zeroCostConfig();
        keep_open.close_open_at_end = false;
        BacktestEngine holder;
        holder.init(keep_open, strategy::PeakReversalConfig::weekly());
        holder.setData(bars);
        holder.run();
        assert(holder.portfolio().openLotCount() == 1);
        assert(holder.getResult().total_trades == 0);
        assert(holder.portfolio().equityCurve().back().time == bars.back().timestamp);
    }

    // A malformed bar inside the trade aborts the run without committing it
    {
        auto bars = tradeSeries();
        bars[39].high = 100.0;      // below its low

        BacktestEngine bt;
        bt.init(zeroCostConfig(), strategy::PeakReversalConfig::weekly());
        bt.setData(bars);
        bool threw = false;
        try {
            bt.run();
        } catch (const SimulationFault&) {
            threw = true;
        }
        assert(threw);
        assert(bt.portfolio().cash() == 10000.0);
        assert(bt.portfolio().tradeLog().empty());
        assert(bt.portfolio().openLotCount() == 0);
    }

    // Loading from a file with weekly resampling
    {
        const auto path = std::filesystem::temp_directory_path() / "peakrev_engine_daily.csv";
        {
            std::ofstream out(path);
            out << "timestamp,open,high,low,close,volume\n";
            const long long day_ms = 24LL * 60 * 60 * 1000;
            for (int d = 0; d < 14; ++d) {
                out << (START_MS + d * day_ms) << ",100,101,99,100,10\n";
            }
        }
        BacktestEngine bt;
        bt.init(zeroCostConfig(), strategy::PeakReversalConfig::weekly());
        bt.loadData(path.string(), true);
        assert(bt.data().size() == 2);
        bt.run();
        assert(bt.getResult().total_trades == 0);
        assert(bt.getResult().final_equity == 10000.0);
        std::filesystem::remove(path);
    }

    // Using the engine before init()
    {
        BacktestEngine bt;
        bool threw = false;
        try {
            bt.run();
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
