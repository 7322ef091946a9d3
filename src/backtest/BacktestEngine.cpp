#include "backtest/BacktestEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace peakrev {
namespace backtest {

BacktestEngine::BacktestEngine()
    : history_data_(std::make_shared<const std::vector<Candle>>())
    , strategy_manager_(std::make_unique<strategy::StrategyManager>())
{
}

void BacktestEngine::init(const Config& config, std::shared_ptr<IRandomSource> random) {
    init(config.getEngineConfig(), config.getStrategyConfig(), std::move(random));
}

void BacktestEngine::init(
    const engine::EngineConfig& engine_config,
    const strategy::PeakReversalConfig& strategy_config,
    std::shared_ptr<IRandomSource> random
) {
    engine_config.validate();
    engine_config_ = engine_config;
    strategy_config_ = strategy_config;

    strategy_ = std::make_shared<const strategy::PeakReversalStrategy>(strategy_config_);
    strategy_manager_ = std::make_unique<strategy::StrategyManager>();
    strategy_manager_->registerStrategy(strategy_);

    portfolio_ = std::make_unique<risk::PortfolioManager>(engine_config_, std::move(random));
    portfolio_->setAnalyticsHook([](const Fill& fill) {
        LOG_DEBUG("{} fill lot {} bar {} @ {:.4f} x {:.6f}{}",
                  toString(fill.kind), fill.lot, fill.bar_index, fill.price, fill.size,
                  fill.crossing ? " (TP/SL crossing)" : "");
    });

    window_.clear();
    next_scan_index_ = 0;
    holding_to_end_ = false;
    signals_.clear();
    proposals_executed_ = 0;
    proposals_rejected_ = 0;
    quality_gate_rejected_ = 0;
    intrabar_collision_count_ = 0;
    dca_fills_ = 0;

    LOG_INFO("BacktestEngine initialized: {} ({}), crossing policy {}, cash {:.2f}",
             strategy_->name(), strategy::toString(strategy_config_.timeframe),
             engine::toString(engine_config_.crossing_policy), engine_config_.initial_cash);
}

void BacktestEngine::loadData(const std::string& file_path, bool resample_weekly) {
    auto candles = DataHistory::load(file_path);
    if (resample_weekly) {
        candles = DataHistory::aggregateWeekly(candles);
    }
    setData(std::move(candles));
}

void BacktestEngine::setData(std::vector<Candle> candles) {
    history_data_ = std::make_shared<const std::vector<Candle>>(std::move(candles));
    window_.clear();
}

const risk::PortfolioManager& BacktestEngine::portfolio() const {
    if (!portfolio_) {
        throw ConfigurationError("backtest engine used before init()");
    }
    return *portfolio_;
}

void BacktestEngine::run() {
    if (!portfolio_) {
        throw ConfigurationError("backtest engine used before init()");
    }

    const auto& data = *history_data_;
    window_.clear();
    LOG_INFO("Starting Backtest with {} candles for {}.", data.size(), symbol_);

    try {
        for (std::size_t i = 0; i < data.size(); ++i) {
            processBar(i);
        }
    } catch (const SimulationFault& e) {
        LOG_ERROR("Backtest aborted for {}: {}", symbol_, e.what());
        throw;
    }

    if (!data.empty()) {
        const Candle& last = data.back();
        if (engine_config_.close_open_at_end && portfolio_->openLotCount() > 0) {
            portfolio_->closeAll({{symbol_, last.close}}, last.timestamp, ExitType::CLOSE);
        } else if (portfolio_->equityCurve().empty() ||
                   portfolio_->equityCurve().back().time < last.timestamp) {
            portfolio_->markToMarket({{symbol_, last.close}}, last.timestamp);
        }
    }

    LOG_INFO("Backtest Completed.");
    LOG_INFO("Final Equity: {:.2f}", getResult().final_equity);
}

// Returns true when a proposal was committed on this bar
bool BacktestEngine::processBar(std::size_t index) {
    const auto& data = *history_data_;
    const Candle& bar = data[index];

    // Bars inside an already realized trade were marked when it was committed
    if (index < next_scan_index_) {
        return false;
    }

    portfolio_->markToMarket({{symbol_, bar.close}}, bar.timestamp);

    if (holding_to_end_) {
        return false;
    }
    const int lookback = strategy_manager_->requiredLookback();
    if (static_cast<int>(index) + 1 < lookback) {
        return false;
    }

    // Bars skipped while a trade was held are appended too
    window_.reserve(data.size());
    while (window_.size() <= index) {
        window_.push_back(data[window_.size()]);
    }
    const auto decision = strategy::aggregateDecisions(
        strategy_manager_->collectDecisions(symbol_, window_));
    if (!decision.isBuy()) {
        return false;
    }
    signals_.push_back(decision);

    if (strategy_config_.require_quality_gate && !strategy_->passesQualityGate(decision)) {
        LOG_INFO("{} signal at bar {} filtered by quality gate (rr {:.2f}, {}, volume x{:.2f})",
                 symbol_, index, decision.risk_reward, strategy::toString(decision.strength),
                 decision.volume_ratio);
        ++quality_gate_rejected_;
        return false;
    }

    const double size = portfolio_->cash() * engine_config_.position_size_ratio / decision.entry_price;
    if (!(size > 0.0) || !std::isfinite(size)) {
        ++proposals_rejected_;
        return false;
    }

    TradeMeta meta;
    meta.symbol = symbol_;
    meta.entry_time = bar.timestamp;
    meta.entry_price = decision.entry_price;
    meta.tp_price = decision.tp_price;
    meta.sl_price = decision.sl_price;
    meta.size = size;
    meta.direction = decision.direction;

    const TradeProposal proposal(meta, history_data_, index);
    if (!portfolio_->tryExecute(proposal, engine_config_.add_buy_pct)) {
        ++proposals_rejected_;
        return false;
    }

    ++proposals_executed_;
    const auto& report = portfolio_->lastExecution();
    if (report.crossing) {
        ++intrabar_collision_count_;
    }
    for (const auto& fill : report.fills) {
        if (fill.kind == FillKind::ADD) {
            ++dca_fills_;
        }
    }

    // Held bars were marked by the portfolio; scanning resumes after them
    next_scan_index_ = report.last_marked_bar + 1;
    if (!report.closed) {
        // Lots stay open until the data ends
        holding_to_end_ = true;
    }
    return true;
}

BacktestEngine::Result BacktestEngine::getResult() const {
    Result result;
    result.initial_cash = engine_config_.initial_cash;
    result.signals_generated = static_cast<int>(signals_.size());
    result.proposals_executed = proposals_executed_;
    result.proposals_rejected = proposals_rejected_;
    result.quality_gate_rejected = quality_gate_rejected_;
    result.intrabar_collision_count = intrabar_collision_count_;
    result.dca_fills = dca_fills_;

    if (!portfolio_) {
        result.final_equity = result.initial_cash;
        return result;
    }

    const auto& curve = portfolio_->equityCurve();
    result.final_equity = curve.empty() ? portfolio_->cash() : curve.back().equity;
    result.total_profit = result.final_equity - result.initial_cash;
    result.total_return_pct = (result.initial_cash > 0.0)
        ? result.total_profit / result.initial_cash * 100.0
        : 0.0;
    result.max_drawdown = calculateMaxDrawdown(curve);

    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    for (const auto& trade : portfolio_->tradeLog()) {
        ++result.total_trades;
        result.exit_reason_counts[toString(trade.exit_type)]++;
        if (trade.result == TradeResult::WIN) {
            ++result.winning_trades;
            gross_profit += trade.pnl;
        } else {
            ++result.losing_trades;
            gross_loss_abs += std::abs(trade.pnl);
        }
    }

    const int closed = result.total_trades;
    result.win_rate = (closed > 0)
        ? static_cast<double>(result.winning_trades) / static_cast<double>(closed)
        : 0.0;
    result.avg_win = (result.winning_trades > 0) ? (gross_profit / result.winning_trades) : 0.0;
    result.avg_loss = (result.losing_trades > 0) ? (gross_loss_abs / result.losing_trades) : 0.0;
    result.profit_factor = (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    result.expectancy = (closed > 0) ? ((gross_profit - gross_loss_abs) / closed) : 0.0;
    return result;
}

double BacktestEngine::calculateMaxDrawdown(const std::vector<risk::EquitySample>& curve) {
    double peak = 0.0;
    double max_drawdown = 0.0;
    for (const auto& sample : curve) {
        peak = std::max(peak, sample.equity);
        if (peak > 0.0) {
            max_drawdown = std::max(max_drawdown, (peak - sample.equity) / peak);
        }
    }
    return max_drawdown;
}

} // namespace backtest
} // namespace peakrev
