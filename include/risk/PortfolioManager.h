#pragma once

#include "risk/PortfolioTypes.h"
#include "backtest/TradeProposal.h"
#include "backtest/TradeSimulator.h"
#include "engine/EngineConfig.h"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace peakrev {
namespace risk {

// Portfolio Manager - cash, open lots, trade log and equity curve for one run
class PortfolioManager {
public:
    using TradeCallback = std::function<void(const TradeLogEntry&)>;

    explicit PortfolioManager(const engine::EngineConfig& config,
                              std::shared_ptr<backtest::IRandomSource> random = nullptr);

    // ===== Execution =====

    // Capacity and cash check, no side effects
    bool canOpen(const std::string& symbol, double entry_price, double size) const;

    // Reserve, realize and commit the proposal's fills as one unit.
    // false: rejected (capacity, cash, no entry bar, already realized); nothing changes.
    // SimulationFault propagates after the state has been rolled back.
    bool tryExecute(const backtest::TradeProposal& proposal, double add_buy_pct);
    bool tryExecute(const backtest::TradeProposal& proposal);

    // Close one lot of a symbol by its index in positions().at(symbol)
    bool closePosition(
        const std::string& symbol,
        std::size_t lot_index,
        double exit_price,
        long long exit_time,
        ExitType exit_type
    );

    // Close every open lot at the given prices (last known price when absent)
    void closeAll(const std::map<std::string, double>& prices, long long time,
                  ExitType exit_type = ExitType::CLOSE);

    // equity = cash + marked value of open lots; appends to the equity curve
    double markToMarket(const std::map<std::string, double>& current_prices, long long time);

    // ===== Callbacks =====
    void setTradeCallback(TradeCallback callback) { trade_callback_ = std::move(callback); }
    void setAnalyticsHook(backtest::AnalyticsHook hook) { analytics_hook_ = std::move(hook); }

    // ===== State =====
    double cash() const { return ledger_.cash; }
    int openLotCount() const { return countLots(ledger_); }
    int maxPositions() const { return config_.max_positions; }
    const std::map<std::string, std::vector<Position>>& positions() const { return ledger_.positions; }
    const std::vector<TradeLogEntry>& tradeLog() const { return ledger_.trade_log; }
    const std::vector<EquitySample>& equityCurve() const { return ledger_.equity_curve; }
    const ExecutionReport& lastExecution() const { return last_execution_; }
    bool isRealized(std::uint64_t proposal_id) const { return realized_ids_.count(proposal_id) > 0; }

    // Marked value of one lot. SHORT lots are collateralised at the entry cost
    // and never mark below zero.
    static double markValue(const Position& lot, double price);

private:
    struct Ledger {
        double cash = 0.0;
        std::map<std::string, std::vector<Position>> positions;
        std::vector<TradeLogEntry> trade_log;
        std::vector<EquitySample> equity_curve;
        std::map<std::string, double> last_prices;
    };

    static int countLots(const Ledger& ledger);
    static TradeLogEntry closeLot(
        Ledger& ledger,
        const std::string& symbol,
        std::size_t lot_index,
        double exit_price,
        long long exit_time,
        ExitType exit_type
    );
    static double mark(Ledger& ledger, const std::map<std::string, double>& prices, long long time);

    void publish(const std::vector<TradeLogEntry>& closed);

    engine::EngineConfig config_;
    backtest::TradeSimulator simulator_;
    Ledger ledger_;
    std::set<std::uint64_t> realized_ids_;
    ExecutionReport last_execution_;

    TradeCallback trade_callback_;
    backtest::AnalyticsHook analytics_hook_;
};

} // namespace risk
} // namespace peakrev
