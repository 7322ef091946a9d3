#pragma once

#include "common/Types.h"
#include "backtest/TradeSimulator.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peakrev {
namespace risk {

// One open lot. Entry and averaging-down fills each get their own lot.
struct Position {
    std::string symbol;
    double entry_price;         // fill price, costs included
    double size;
    Direction direction;
    long long entry_time;

    std::uint64_t proposal_id;  // proposal that opened the lot
    int lot;                    // 0 = primary, 1 = averaging-down

    Position()
        : entry_price(0), size(0), direction(Direction::LONG)
        , entry_time(0), proposal_id(0), lot(0)
    {}

    Position(const std::string& symbol_, double entry_price_, double size_,
             Direction direction_, long long entry_time_,
             std::uint64_t proposal_id_ = 0, int lot_ = 0)
        : symbol(symbol_), entry_price(entry_price_), size(size_)
        , direction(direction_), entry_time(entry_time_)
        , proposal_id(proposal_id_), lot(lot_)
    {}

    double costBasis() const { return entry_price * size; }
};

// Closed lot, append-only
struct TradeLogEntry {
    std::string symbol;
    Direction direction;
    long long entry_time;
    long long exit_time;
    double entry_price;
    double exit_price;
    double size;
    ExitType exit_type;
    TradeResult result;
    double return_pct;          // percent of the cost basis
    double pnl;

    std::uint64_t proposal_id;
    int lot;

    TradeLogEntry()
        : direction(Direction::LONG), entry_time(0), exit_time(0)
        , entry_price(0), exit_price(0), size(0)
        , exit_type(ExitType::CLOSE), result(TradeResult::LOSS)
        , return_pct(0), pnl(0), proposal_id(0), lot(0)
    {}
};

struct EquitySample {
    long long time;
    double equity;

    EquitySample() : time(0), equity(0) {}
    EquitySample(long long time_, double equity_) : time(time_), equity(equity_) {}
};

// Fills committed by the most recent successful tryExecute
struct ExecutionReport {
    std::uint64_t proposal_id = 0;
    std::vector<backtest::Fill> fills;
    bool closed = false;
    std::optional<std::size_t> exit_bar_index;
    std::size_t last_marked_bar = 0;    // equity is marked on every bar up to here
    bool crossing = false;
    bool add_skipped = false;
};

} // namespace risk
} // namespace peakrev
