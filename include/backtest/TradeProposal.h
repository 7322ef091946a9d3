#pragma once

#include "common/Types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace peakrev {
namespace backtest {

// Planned trade, fixed when the signal is confirmed
struct TradeMeta {
    std::string symbol;
    long long entry_time = 0;       // timestamp of the signal bar
    double entry_price = 0.0;
    double tp_price = 0.0;
    double sl_price = 0.0;
    double size = 0.0;
    Direction direction = Direction::LONG;
};

// Immutable proposal: the trade plan plus the candles that follow the signal bar.
// Building one has no side effects; realize() is the only consumer.
class TradeProposal {
public:
    TradeProposal(TradeMeta meta,
                  std::shared_ptr<const std::vector<Candle>> candles,
                  std::size_t signal_index);

    std::uint64_t id() const { return id_; }
    const TradeMeta& meta() const { return meta_; }
    const std::vector<Candle>& candles() const { return *candles_; }
    std::size_t signalIndex() const { return signal_index_; }

    // First bar of the forward slice (the bar after the signal)
    std::size_t forwardBegin() const { return signal_index_ + 1; }
    std::size_t forwardSize() const;

private:
    std::uint64_t id_;
    TradeMeta meta_;
    std::shared_ptr<const std::vector<Candle>> candles_;
    std::size_t signal_index_;
};

} // namespace backtest
} // namespace peakrev
