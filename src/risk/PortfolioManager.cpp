#include "risk/PortfolioManager.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <optional>

namespace peakrev {
namespace risk {

namespace {

std::optional<std::size_t> findLot(
    const std::vector<Position>& lots,
    std::uint64_t proposal_id,
    int lot
) {
    for (std::size_t i = 0; i < lots.size(); ++i) {
        if (lots[i].proposal_id == proposal_id && lots[i].lot == lot) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace

PortfolioManager::PortfolioManager(
    const engine::EngineConfig& config,
    std::shared_ptr<backtest::IRandomSource> random
)
    : config_(config)
    , simulator_(config, std::move(random))
{
    ledger_.cash = config_.initial_cash;
    LOG_INFO("PortfolioManager initialized - initial cash {:.2f}, max positions {}",
             config_.initial_cash, config_.max_positions);
}

// ===== Execution =====

bool PortfolioManager::canOpen(const std::string& symbol, double entry_price, double size) const {
    (void)symbol;
    if (countLots(ledger_) >= config_.max_positions) {
        return false;
    }
    return ledger_.cash >= entry_price * size;
}

bool PortfolioManager::tryExecute(const backtest::TradeProposal& proposal) {
    return tryExecute(proposal, config_.add_buy_pct);
}

bool PortfolioManager::tryExecute(const backtest::TradeProposal& proposal, double add_buy_pct) {
    const auto& meta = proposal.meta();

    if (realized_ids_.count(proposal.id()) > 0) {
        LOG_WARN("{} proposal #{} was already realized", meta.symbol, proposal.id());
        return false;
    }
    if (countLots(ledger_) >= config_.max_positions) {
        LOG_WARN("{} rejected: max positions reached ({}/{})",
                 meta.symbol, countLots(ledger_), config_.max_positions);
        return false;
    }
    if (!canOpen(meta.symbol, meta.entry_price, meta.size)) {
        LOG_WARN("{} rejected: cash {:.2f} < required {:.2f}",
                 meta.symbol, ledger_.cash, meta.entry_price * meta.size);
        return false;
    }

    // All mutations go to the staged copy; ledger_ is replaced only on commit
    Ledger staged = ledger_;
    const double reserved = meta.entry_price * meta.size;
    staged.cash -= reserved;
    staged.positions[meta.symbol].emplace_back(meta.symbol, meta.entry_price, meta.size, meta.direction,
                                               meta.entry_time, proposal.id(), 0);

    const auto outcome = simulator_.realize(proposal, add_buy_pct, analytics_hook_);
    if (!outcome) {
        LOG_INFO("{} proposal #{} dropped: no bar for the entry fill", meta.symbol, proposal.id());
        return false;
    }

    ExecutionReport report;
    report.proposal_id = proposal.id();
    std::vector<TradeLogEntry> closed;
    bool add_open = false;

    // Fills are applied bar by bar and every held bar is marked at its close;
    // lots still open are marked through the last bar of data
    const auto& candles = proposal.candles();
    const std::size_t first_bar = outcome->fills.front().bar_index;
    const std::size_t last_bar = (outcome->closed && outcome->exit_bar_index)
        ? *outcome->exit_bar_index
        : candles.size() - 1;

    std::size_t next_fill = 0;
    for (std::size_t bar = first_bar; bar <= last_bar; ++bar) {
        while (next_fill < outcome->fills.size() && outcome->fills[next_fill].bar_index == bar) {
            const auto& fill = outcome->fills[next_fill++];
            switch (fill.kind) {
                case backtest::FillKind::ENTRY: {
                    // Actual fill cost replaces the reservation
                    staged.cash += reserved;
                    const double cost = fill.price * fill.size;
                    if (cost > staged.cash) {
                        LOG_WARN("{} rejected: entry fill cost {:.2f} exceeds cash {:.2f}",
                                 meta.symbol, cost, staged.cash);
                        return false;
                    }
                    staged.cash -= cost;
                    auto& lots = staged.positions[meta.symbol];
                    const auto index = findLot(lots, proposal.id(), 0);
                    if (!index) {
                        throw SimulationFault("reserved lot missing for " + meta.symbol);
                    }
                    lots[*index].entry_price = fill.price;
                    lots[*index].entry_time = fill.time;
                    report.fills.push_back(fill);
                    break;
                }
                case backtest::FillKind::ADD: {
                    const double cost = fill.price * fill.size;
                    if (countLots(staged) >= config_.max_positions || cost > staged.cash) {
                        LOG_WARN("{} averaging-down fill skipped: lots {}/{}, cost {:.2f}, cash {:.2f}",
                                 meta.symbol, countLots(staged), config_.max_positions, cost, staged.cash);
                        report.add_skipped = true;
                        break;
                    }
                    staged.cash -= cost;
                    staged.positions[meta.symbol].emplace_back(
                        meta.symbol, fill.price, fill.size, meta.direction, fill.time, proposal.id(), 1);
                    add_open = true;
                    report.fills.push_back(fill);
                    break;
                }
                case backtest::FillKind::EXIT: {
                    if (fill.lot == 1 && !add_open) {
                        break;
                    }
                    const auto index = findLot(staged.positions[meta.symbol], proposal.id(), fill.lot);
                    if (!index) {
                        throw SimulationFault("exit fill for unknown lot of " + meta.symbol);
                    }
                    closed.push_back(closeLot(staged, meta.symbol, *index, fill.price, fill.time, fill.exit_type));
                    if (fill.lot == 1) {
                        add_open = false;
                    }
                    report.fills.push_back(fill);
                    break;
                }
            }
        }
        mark(staged, {{meta.symbol, candles[bar].close}}, candles[bar].timestamp);
    }
    if (next_fill != outcome->fills.size()) {
        throw SimulationFault("fills out of bar order for " + meta.symbol);
    }

    report.closed = outcome->closed;
    report.exit_bar_index = outcome->exit_bar_index;
    report.last_marked_bar = last_bar;
    report.crossing = outcome->crossing;

    // Commit
    ledger_ = std::move(staged);
    realized_ids_.insert(proposal.id());
    last_execution_ = std::move(report);

    LOG_INFO("Executed {} #{} {} | entry {:.4f} | {} | cash {:.2f}",
             meta.symbol, proposal.id(), toString(meta.direction),
             last_execution_.fills.front().price,
             outcome->closed ? toString(outcome->exit_type) : "open", ledger_.cash);

    publish(closed);
    return true;
}

bool PortfolioManager::closePosition(
    const std::string& symbol,
    std::size_t lot_index,
    double exit_price,
    long long exit_time,
    ExitType exit_type
) {
    auto it = ledger_.positions.find(symbol);
    if (it == ledger_.positions.end() || lot_index >= it->second.size()) {
        LOG_WARN("closePosition: no lot {} for {}", lot_index, symbol);
        return false;
    }

    const TradeLogEntry entry = closeLot(ledger_, symbol, lot_index, exit_price, exit_time, exit_type);
    mark(ledger_, {{symbol, exit_price}}, exit_time);
    publish({entry});
    return true;
}

void PortfolioManager::closeAll(
    const std::map<std::string, double>& prices,
    long long time,
    ExitType exit_type
) {
    std::vector<TradeLogEntry> closed;
    while (!ledger_.positions.empty()) {
        const std::string symbol = ledger_.positions.begin()->first;
        const Position& lot = ledger_.positions.begin()->second.front();

        double price = lot.entry_price;
        auto p = prices.find(symbol);
        if (p != prices.end()) {
            price = p->second;
        } else {
            auto last = ledger_.last_prices.find(symbol);
            if (last != ledger_.last_prices.end()) {
                price = last->second;
            }
        }
        closed.push_back(closeLot(ledger_, symbol, 0, price, time, exit_type));
    }

    mark(ledger_, prices, time);
    if (!closed.empty()) {
        LOG_INFO("Closed {} remaining lot(s), cash {:.2f}", closed.size(), ledger_.cash);
    }
    publish(closed);
}

double PortfolioManager::markToMarket(const std::map<std::string, double>& current_prices, long long time) {
    return mark(ledger_, current_prices, time);
}

double PortfolioManager::markValue(const Position& lot, double price) {
    if (lot.direction == Direction::SHORT) {
        // Loss is capped at the posted collateral
        return std::max(0.0, (2.0 * lot.entry_price - price) * lot.size);
    }
    return price * lot.size;
}

// ===== Private helpers =====

int PortfolioManager::countLots(const Ledger& ledger) {
    int count = 0;
    for (const auto& [symbol, lots] : ledger.positions) {
        count += static_cast<int>(lots.size());
    }
    return count;
}

TradeLogEntry PortfolioManager::closeLot(
    Ledger& ledger,
    const std::string& symbol,
    std::size_t lot_index,
    double exit_price,
    long long exit_time,
    ExitType exit_type
) {
    auto it = ledger.positions.find(symbol);
    const Position lot = it->second[lot_index];

    const double proceeds = markValue(lot, exit_price);
    ledger.cash += proceeds;

    TradeLogEntry entry;
    entry.symbol = lot.symbol;
    entry.direction = lot.direction;
    entry.entry_time = lot.entry_time;
    entry.exit_time = exit_time;
    entry.entry_price = lot.entry_price;
    entry.exit_price = exit_price;
    entry.size = lot.size;
    entry.exit_type = exit_type;
    entry.pnl = proceeds - lot.costBasis();
    entry.return_pct = lot.costBasis() > 0.0 ? entry.pnl / lot.costBasis() * 100.0 : 0.0;
    entry.result = classifyReturn(entry.pnl);
    entry.proposal_id = lot.proposal_id;
    entry.lot = lot.lot;
    ledger.trade_log.push_back(entry);

    it->second.erase(it->second.begin() + static_cast<std::ptrdiff_t>(lot_index));
    if (it->second.empty()) {
        ledger.positions.erase(it);
    }
    return entry;
}

double PortfolioManager::mark(Ledger& ledger, const std::map<std::string, double>& prices, long long time) {
    for (const auto& [symbol, price] : prices) {
        ledger.last_prices[symbol] = price;
    }

    double equity = ledger.cash;
    for (const auto& [symbol, lots] : ledger.positions) {
        auto last = ledger.last_prices.find(symbol);
        for (const auto& lot : lots) {
            const double price = (last != ledger.last_prices.end()) ? last->second : lot.entry_price;
            equity += markValue(lot, price);
        }
    }

    ledger.equity_curve.emplace_back(time, equity);
    return equity;
}

void PortfolioManager::publish(const std::vector<TradeLogEntry>& closed) {
    for (const auto& entry : closed) {
        LOG_INFO("Lot closed: {} lot {} | {} at {:.4f} | pnl {:.2f} ({:+.2f}%) | {}",
                 entry.symbol, entry.lot, toString(entry.exit_type), entry.exit_price,
                 entry.pnl, entry.return_pct, toString(entry.result));
        Logger::getInstance().logTrade(entry);
        if (trade_callback_) {
            try {
                trade_callback_(entry);
            } catch (const std::exception& e) {
                LOG_WARN("Trade callback threw for {}: {}", entry.symbol, e.what());
            }
        }
    }
}

} // namespace risk
} // namespace peakrev
