#include "backtest/TradeSimulator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace peakrev {
namespace backtest {

namespace {

bool isPositiveFinite(double v) {
    return std::isfinite(v) && v > 0.0;
}

void validateBar(const Candle& bar, std::size_t index) {
    if (!isPositiveFinite(bar.open) || !isPositiveFinite(bar.high) ||
        !isPositiveFinite(bar.low) || !isPositiveFinite(bar.close)) {
        throw SimulationFault("non-finite or non-positive price at bar " + std::to_string(index));
    }
    if (bar.high < bar.low) {
        throw SimulationFault("high < low at bar " + std::to_string(index));
    }
    if (bar.open > bar.high || bar.open < bar.low || bar.close > bar.high || bar.close < bar.low) {
        throw SimulationFault("open/close outside range at bar " + std::to_string(index));
    }
}

void validateMeta(const TradeMeta& meta) {
    if (!isPositiveFinite(meta.entry_price) || !isPositiveFinite(meta.tp_price) ||
        !isPositiveFinite(meta.sl_price) || !isPositiveFinite(meta.size)) {
        throw SimulationFault("undefined or non-positive level in proposal for " + meta.symbol);
    }
    const bool ordered = (meta.direction == Direction::LONG)
        ? (meta.sl_price < meta.entry_price && meta.entry_price < meta.tp_price)
        : (meta.tp_price < meta.entry_price && meta.entry_price < meta.sl_price);
    if (!ordered) {
        throw SimulationFault("TP/SL levels inconsistent with direction for " + meta.symbol);
    }
}

// Worse-for-us adjustment applied to entry-side fills
double applyEntryCosts(double price, Direction direction, double fee, double slippage) {
    if (direction == Direction::LONG) {
        return price * (1.0 + slippage) * (1.0 + fee);
    }
    return price * (1.0 - slippage) * (1.0 - fee);
}

void notify(const AnalyticsHook& hook, const Fill& fill) {
    if (!hook) {
        return;
    }
    try {
        hook(fill);
    } catch (const std::exception& e) {
        LOG_WARN("Analytics hook threw on {} fill: {}", toString(fill.kind), e.what());
    }
}

ExitType resolveCrossing(engine::CrossingPolicy policy, IRandomSource* random) {
    switch (policy) {
        case engine::CrossingPolicy::PREFER_SL:
            return ExitType::SL;
        case engine::CrossingPolicy::PREFER_TP:
            return ExitType::TP;
        case engine::CrossingPolicy::RANDOM:
            if (random == nullptr) {
                throw SimulationFault("random crossing policy without a random source");
            }
            return random->nextUniform() < 0.5 ? ExitType::TP : ExitType::SL;
    }
    throw SimulationFault("unknown crossing policy");
}

} // namespace

const char* toString(FillKind kind) {
    switch (kind) {
        case FillKind::ENTRY: return "ENTRY";
        case FillKind::ADD: return "ADD";
        default: return "EXIT";
    }
}

std::optional<SimulationOutcome> realize(
    const TradeProposal& proposal,
    double add_buy_pct,
    double fee,
    double slippage,
    int execution_delay_bars,
    engine::CrossingPolicy crossing_policy,
    IRandomSource* random,
    const AnalyticsHook& analytics_hook
) {
    const TradeMeta& meta = proposal.meta();
    const auto& candles = proposal.candles();
    const bool is_long = (meta.direction == Direction::LONG);

    validateMeta(meta);
    if (execution_delay_bars < 0) {
        throw SimulationFault("negative execution delay");
    }

    const std::size_t entry_index = proposal.forwardBegin() + static_cast<std::size_t>(execution_delay_bars);
    if (entry_index >= candles.size()) {
        LOG_DEBUG("{}: no bar for entry (index {} of {})", meta.symbol, entry_index, candles.size());
        return std::nullopt;
    }

    SimulationOutcome outcome;

    // 1. Entry fill: limit at the planned level, improved by a better open
    const Candle& entry_bar = candles[entry_index];
    validateBar(entry_bar, entry_index);
    const double raw_entry = is_long
        ? std::min(entry_bar.open, meta.entry_price)
        : std::max(entry_bar.open, meta.entry_price);

    Fill entry;
    entry.kind = FillKind::ENTRY;
    entry.lot = 0;
    entry.bar_index = entry_index;
    entry.time = entry_bar.timestamp;
    entry.price = applyEntryCosts(raw_entry, meta.direction, fee, slippage);
    entry.size = meta.size;
    outcome.fills.push_back(entry);
    notify(analytics_hook, entry);

    // 2. Averaging-down trigger, fixed ratio off the entry fill
    const bool dca_enabled = add_buy_pct > 0.0;
    const double dca_trigger = entry.price * (is_long ? DCA_LONG_TRIGGER_RATIO : DCA_SHORT_TRIGGER_RATIO);
    std::vector<Fill> open_lots{entry};

    // 3. Forward scan, starting on the entry bar
    for (std::size_t i = entry_index; i < candles.size(); ++i) {
        const Candle& bar = candles[i];
        if (i != entry_index) {
            validateBar(bar, i);
        }

        if (dca_enabled && !outcome.dca_used) {
            const bool crossed = is_long ? (bar.low <= dca_trigger) : (bar.high >= dca_trigger);
            if (crossed) {
                Fill add;
                add.kind = FillKind::ADD;
                add.lot = 1;
                add.bar_index = i;
                add.time = bar.timestamp;
                add.price = applyEntryCosts(dca_trigger, meta.direction, fee, slippage);
                add.size = meta.size * add_buy_pct;
                outcome.fills.push_back(add);
                outcome.dca_used = true;
                open_lots.push_back(add);
                notify(analytics_hook, add);
            }
        }

        const bool sl_hit = is_long ? (bar.low <= meta.sl_price) : (bar.high >= meta.sl_price);
        const bool tp_hit = is_long ? (bar.high >= meta.tp_price) : (bar.low <= meta.tp_price);
        if (!sl_hit && !tp_hit) {
            continue;
        }

        const bool crossing = sl_hit && tp_hit;
        ExitType exit_type = sl_hit ? ExitType::SL : ExitType::TP;
        if (crossing) {
            exit_type = resolveCrossing(crossing_policy, random);
        }
        const double exit_price = (exit_type == ExitType::SL) ? meta.sl_price : meta.tp_price;

        // Every open lot exits independently at the triggered level
        for (const auto& lot : open_lots) {
            Fill exit;
            exit.kind = FillKind::EXIT;
            exit.lot = lot.lot;
            exit.bar_index = i;
            exit.time = bar.timestamp;
            exit.price = exit_price;
            exit.size = lot.size;
            exit.exit_type = exit_type;
            exit.crossing = crossing;
            outcome.fills.push_back(exit);
            notify(analytics_hook, exit);
        }

        outcome.closed = true;
        outcome.exit_bar_index = i;
        outcome.exit_type = exit_type;
        outcome.exit_price = exit_price;
        outcome.crossing = crossing;
        const double move = is_long ? (exit_price - meta.entry_price) : (meta.entry_price - exit_price);
        outcome.return_pct = move / meta.entry_price * 100.0;
        outcome.result = classifyReturn(outcome.return_pct);
        return outcome;
    }

    LOG_DEBUG("{}: data ended with {} open lot(s)", meta.symbol, open_lots.size());
    return outcome;
}

TradeSimulator::TradeSimulator(const engine::EngineConfig& config, std::shared_ptr<IRandomSource> random)
    : config_(config)
    , random_(std::move(random))
{
    config_.validate();
    if (!random_) {
        random_ = std::make_shared<SeededRandomSource>(config_.random_seed);
    }
}

std::optional<SimulationOutcome> TradeSimulator::realize(
    const TradeProposal& proposal,
    double add_buy_pct,
    const AnalyticsHook& analytics_hook
) const {
    return backtest::realize(
        proposal,
        add_buy_pct,
        config_.fee,
        config_.slippage,
        config_.execution_delay_bars,
        config_.crossing_policy,
        random_.get(),
        analytics_hook);
}

} // namespace backtest
} // namespace peakrev
