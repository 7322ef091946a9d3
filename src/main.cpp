#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestEngine.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace peakrev;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_SIMULATION_FAULT = 2;
constexpr int EXIT_CONFIG_ERROR = 3;

struct CliOptions {
    std::string data_path;
    std::string config_path = "config/config.json";
    std::string symbol = "BTCUSDT";
    std::string timeframe;
    std::string crossing_policy;
    bool resample_weekly = false;
    bool json_mode = false;
    bool has_initial_cash = false;
    double initial_cash = 0.0;
    bool has_seed = false;
    std::uint64_t seed = 0;
};

void printUsage() {
    std::cerr << "Usage: peakrev_backtest <candles.csv|json> [options]\n"
              << "  --config <path>            configuration file (default config/config.json)\n"
              << "  --symbol <S>               symbol label for the series\n"
              << "  --timeframe daily|weekly   detector preset\n"
              << "  --resample-weekly          aggregate daily candles into weeks\n"
              << "  --initial-cash <X>\n"
              << "  --crossing-policy <P>      prefer_sl | prefer_tp | random\n"
              << "  --seed <N>                 seed for the random crossing policy\n"
              << "  --json                     print the result as JSON\n";
}

// nullopt on unknown flags, missing or malformed values; `error` names the problem
std::optional<CliOptions> parseArgs(int argc, char* argv[], std::string& error) {
    CliOptions opts;
    opts.data_path = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool takes_value = arg == "--config" || arg == "--symbol" || arg == "--timeframe" ||
                                 arg == "--crossing-policy" || arg == "--initial-cash" || arg == "--seed";
        if (arg == "--json") {
            opts.json_mode = true;
            continue;
        }
        if (arg == "--resample-weekly") {
            opts.resample_weekly = true;
            continue;
        }
        if (!takes_value) {
            error = "unknown option " + arg;
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            error = "missing value for " + arg;
            return std::nullopt;
        }
        const std::string value = argv[++i];

        try {
            if (arg == "--config") {
                opts.config_path = value;
            } else if (arg == "--symbol") {
                opts.symbol = value;
            } else if (arg == "--timeframe") {
                opts.timeframe = value;
            } else if (arg == "--crossing-policy") {
                opts.crossing_policy = value;
            } else if (arg == "--initial-cash") {
                opts.initial_cash = std::stod(value);
                opts.has_initial_cash = true;
            } else {
                opts.seed = std::stoull(value);
                opts.has_seed = true;
            }
        } catch (const std::invalid_argument&) {
            error = "invalid value for " + arg + ": " + value;
            return std::nullopt;
        } catch (const std::out_of_range&) {
            error = "value out of range for " + arg + ": " + value;
            return std::nullopt;
        }
    }
    return opts;
}

nlohmann::json resultToJson(const backtest::BacktestEngine& engine) {
    const auto result = engine.getResult();
    nlohmann::json j;
    j["symbol"] = engine.symbol();
    j["initial_cash"] = result.initial_cash;
    j["final_equity"] = result.final_equity;
    j["total_profit"] = result.total_profit;
    j["total_return_pct"] = result.total_return_pct;
    j["max_drawdown"] = result.max_drawdown;
    j["total_trades"] = result.total_trades;
    j["winning_trades"] = result.winning_trades;
    j["losing_trades"] = result.losing_trades;
    j["win_rate"] = result.win_rate;
    j["avg_win"] = result.avg_win;
    j["avg_loss"] = result.avg_loss;
    j["profit_factor"] = result.profit_factor;
    j["expectancy"] = result.expectancy;
    j["signals_generated"] = result.signals_generated;
    j["proposals_executed"] = result.proposals_executed;
    j["proposals_rejected"] = result.proposals_rejected;
    j["quality_gate_rejected"] = result.quality_gate_rejected;
    j["intrabar_collision_count"] = result.intrabar_collision_count;
    j["dca_fills"] = result.dca_fills;
    j["exit_reason_counts"] = result.exit_reason_counts;

    j["trades"] = nlohmann::json::array();
    for (const auto& t : engine.portfolio().tradeLog()) {
        j["trades"].push_back({
            {"symbol", t.symbol},
            {"direction", toString(t.direction)},
            {"lot", t.lot},
            {"entry_time", t.entry_time},
            {"exit_time", t.exit_time},
            {"entry_price", t.entry_price},
            {"exit_price", t.exit_price},
            {"size", t.size},
            {"exit_type", toString(t.exit_type)},
            {"result", toString(t.result)},
            {"return_pct", t.return_pct},
            {"pnl", t.pnl}
        });
    }

    j["equity_curve"] = nlohmann::json::array();
    for (const auto& s : engine.portfolio().equityCurve()) {
        j["equity_curve"].push_back({{"time", s.time}, {"equity", s.equity}});
    }
    return j;
}

void printSummary(const backtest::BacktestEngine& engine) {
    const auto result = engine.getResult();
    std::cout << "\nBacktest result (" << engine.symbol() << ")\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Final equity:   " << result.final_equity << "\n";
    std::cout << "Total profit:   " << result.total_profit << " (" << result.total_return_pct << "%)\n";
    std::cout << "Max drawdown:   " << (result.max_drawdown * 100.0) << "%\n";
    std::cout << "Signals:        " << result.signals_generated
              << " (executed " << result.proposals_executed
              << ", rejected " << result.proposals_rejected
              << ", gated " << result.quality_gate_rejected << ")\n";
    std::cout << "Closed lots:    " << result.total_trades
              << " (W " << result.winning_trades << " / L " << result.losing_trades << ")\n";
    std::cout << "Win rate:       " << (result.win_rate * 100.0) << "%\n";
    std::cout << "Avg win:        " << result.avg_win << "\n";
    std::cout << "Avg loss:       " << result.avg_loss << "\n";
    std::cout << "Profit factor:  " << std::setprecision(3) << result.profit_factor << "\n";
    std::cout << "Expectancy:     " << std::setprecision(2) << result.expectancy << " /trade\n";
    std::cout << "TP/SL crossings: " << result.intrabar_collision_count << "\n";
    for (const auto& [reason, count] : result.exit_reason_counts) {
        std::cout << "  exit " << reason << ": " << count << "\n";
    }
    std::cout << "---------------------------------------------\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return EXIT_USAGE;
    }

    std::string cli_error;
    const auto parsed = parseArgs(argc, argv, cli_error);
    if (!parsed) {
        std::cerr << cli_error << "\n";
        printUsage();
        return EXIT_USAGE;
    }
    const CliOptions& opts = *parsed;

    try {

        auto& config = Config::getInstance();
        config.load(opts.config_path);

        Logger::getInstance().initialize(config.getLogDir(), opts.json_mode ? "off" : config.getLogLevel());

        if (!opts.timeframe.empty()) {
            config.setTimeframe(strategy::parseTimeframe(opts.timeframe));
        }
        if (!opts.crossing_policy.empty()) {
            config.setCrossingPolicy(engine::parseCrossingPolicy(opts.crossing_policy));
        }
        if (opts.has_initial_cash) {
            config.setInitialCash(opts.initial_cash);
        }
        if (opts.has_seed) {
            config.setRandomSeed(opts.seed);
        }

        if (!std::filesystem::exists(opts.data_path)) {
            std::cerr << "Candle file not found: " << opts.data_path << "\n";
            return EXIT_USAGE;
        }
        LOG_INFO("Starting Backtest Mode with file: {}", opts.data_path);

        backtest::BacktestEngine bt_engine;
        bt_engine.init(config);
        bt_engine.setSymbol(opts.symbol);
        bt_engine.loadData(opts.data_path, opts.resample_weekly);
        bt_engine.run();

        if (opts.json_mode) {
            std::cout << resultToJson(bt_engine).dump() << "\n";
        } else {
            printSummary(bt_engine);
        }
        return 0;

    } catch (const SimulationFault& e) {
        LOG_ERROR("{}", e.what());
        std::cerr << e.what() << "\n";
        return EXIT_SIMULATION_FAULT;
    } catch (const ConfigurationError& e) {
        LOG_ERROR("{}", e.what());
        std::cerr << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}
