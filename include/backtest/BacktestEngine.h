#pragma once

#include <vector>
#include <string>
#include <map>
#include <memory>
#include "common/Types.h"
#include "common/Config.h"
#include "backtest/DataHistory.h"
#include "backtest/TradeSimulator.h"
#include "strategy/StrategyManager.h"
#include "strategy/PeakReversalStrategy.h"
#include "risk/PortfolioManager.h"

namespace peakrev {
namespace backtest {

class BacktestEngine {
public:
    BacktestEngine();

    // Initialize engine with configuration. Throws ConfigurationError.
    void init(const Config& config, std::shared_ptr<IRandomSource> random = nullptr);
    void init(const engine::EngineConfig& engine_config,
              const strategy::PeakReversalConfig& strategy_config,
              std::shared_ptr<IRandomSource> random = nullptr);

    // Load historical data
    void loadData(const std::string& file_path, bool resample_weekly = false);
    void setData(std::vector<Candle> candles);
    void setSymbol(const std::string& symbol) { symbol_ = symbol; }

    // Run the backtest simulation. SimulationFault is logged and rethrown.
    void run();

    // Get results
    struct Result {
        double initial_cash = 0.0;
        double final_equity = 0.0;
        double total_profit = 0.0;
        double total_return_pct = 0.0;
        double max_drawdown = 0.0;          // fraction of the running equity peak
        int total_trades = 0;               // closed lots
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double profit_factor = 0.0;
        double expectancy = 0.0;
        int signals_generated = 0;
        int proposals_executed = 0;
        int proposals_rejected = 0;
        int quality_gate_rejected = 0;
        int intrabar_collision_count = 0;
        int dca_fills = 0;
        std::map<std::string, int> exit_reason_counts;
    };
    Result getResult() const;

    const risk::PortfolioManager& portfolio() const;
    const std::vector<strategy::Decision>& signals() const { return signals_; }
    const std::vector<Candle>& data() const { return *history_data_; }
    const std::string& symbol() const { return symbol_; }

private:
    bool processBar(std::size_t index);
    static double calculateMaxDrawdown(const std::vector<risk::EquitySample>& curve);

    std::shared_ptr<const std::vector<Candle>> history_data_;
    std::string symbol_ = "BTCUSDT"; // Default for backtest

    engine::EngineConfig engine_config_;
    strategy::PeakReversalConfig strategy_config_;

    // Components
    std::shared_ptr<const strategy::PeakReversalStrategy> strategy_;
    std::unique_ptr<strategy::StrategyManager> strategy_manager_;
    std::unique_ptr<risk::PortfolioManager> portfolio_;

    // Scan state
    std::vector<Candle> window_;        // data[0..current bar], grown in place
    std::size_t next_scan_index_ = 0;
    bool holding_to_end_ = false;
    std::vector<strategy::Decision> signals_;

    // Counters
    int proposals_executed_ = 0;
    int proposals_rejected_ = 0;
    int quality_gate_rejected_ = 0;
    int intrabar_collision_count_ = 0;
    int dca_fills_ = 0;
};

} // namespace backtest
} // namespace peakrev
