#include "backtest/TradeProposal.h"
#include "common/Errors.h"
#include <atomic>

namespace peakrev {
namespace backtest {

namespace {
std::atomic<std::uint64_t> g_next_proposal_id{1};
}

TradeProposal::TradeProposal(TradeMeta meta,
                             std::shared_ptr<const std::vector<Candle>> candles,
                             std::size_t signal_index)
    : id_(g_next_proposal_id.fetch_add(1))
    , meta_(std::move(meta))
    , candles_(std::move(candles))
    , signal_index_(signal_index)
{
    if (!candles_) {
        throw SimulationFault("proposal for " + meta_.symbol + " has no candle data");
    }
    if (signal_index_ >= candles_->size()) {
        throw SimulationFault("proposal signal index out of range for " + meta_.symbol);
    }
}

std::size_t TradeProposal::forwardSize() const {
    return candles_->size() - forwardBegin();
}

} // namespace backtest
} // namespace peakrev
