#pragma once

#include "backtest/TradeProposal.h"
#include "engine/EngineConfig.h"
#include "common/Types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace peakrev {
namespace backtest {

enum class FillKind { ENTRY, ADD, EXIT };

const char* toString(FillKind kind);

struct Fill {
    FillKind kind = FillKind::ENTRY;
    int lot = 0;                    // 0 = primary lot, 1 = averaging-down lot
    std::size_t bar_index = 0;
    long long time = 0;
    double price = 0.0;
    double size = 0.0;
    ExitType exit_type = ExitType::CLOSE;   // EXIT fills only
    bool crossing = false;                  // TP and SL both touched on this bar
};

struct SimulationOutcome {
    std::vector<Fill> fills;
    bool closed = false;                    // false: data ended with lots still open
    std::optional<std::size_t> exit_bar_index;
    ExitType exit_type = ExitType::CLOSE;
    double exit_price = 0.0;
    double return_pct = 0.0;                // vs. the planned entry price, percent
    TradeResult result = TradeResult::LOSS;
    bool crossing = false;
    bool dca_used = false;
};

// Uniform [0, 1) draws for the "random" crossing policy
class IRandomSource {
public:
    virtual ~IRandomSource() = default;
    virtual double nextUniform() = 0;
};

class SeededRandomSource : public IRandomSource {
public:
    explicit SeededRandomSource(std::uint64_t seed) : engine_(seed), dist_(0.0, 1.0) {}
    double nextUniform() override { return dist_(engine_); }

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_;
};

// Diagnostics only; exceptions thrown by the hook are logged and ignored
using AnalyticsHook = std::function<void(const Fill&)>;

constexpr double DCA_LONG_TRIGGER_RATIO = 0.95;
constexpr double DCA_SHORT_TRIGGER_RATIO = 1.05;

// Bar-by-bar fill simulation of one proposal. Returns nullopt when the entry bar
// lies beyond the data. Throws SimulationFault on malformed bars or levels.
std::optional<SimulationOutcome> realize(
    const TradeProposal& proposal,
    double add_buy_pct,
    double fee,
    double slippage,
    int execution_delay_bars,
    engine::CrossingPolicy crossing_policy,
    IRandomSource* random,
    const AnalyticsHook& analytics_hook = {}
);

// realize() bound to the run's execution settings and random source
class TradeSimulator {
public:
    // A null random source is replaced by SeededRandomSource(config.random_seed)
    explicit TradeSimulator(const engine::EngineConfig& config,
                            std::shared_ptr<IRandomSource> random = nullptr);

    std::optional<SimulationOutcome> realize(
        const TradeProposal& proposal,
        double add_buy_pct,
        const AnalyticsHook& analytics_hook = {}
    ) const;

    const engine::EngineConfig& config() const { return config_; }

private:
    engine::EngineConfig config_;
    std::shared_ptr<IRandomSource> random_;
};

} // namespace backtest
} // namespace peakrev
