#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>

namespace peakrev {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    engine_config_ = engine::EngineConfig();
    strategy_config_ = strategy::PeakReversalConfig::weekly();
    log_level_ = "info";
    log_dir_ = "logs";
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    if (!std::filesystem::exists(config_path)) {
        // Relative paths may also be given from the working directory
        if (std::filesystem::exists(path)) {
            config_path = path;
        } else {
            LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
            return;
        }
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("malformed JSON in " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    LOG_INFO("Config loaded: {}", config_path.string());
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::EngineConfig engine_cfg = engine_config_;
    strategy::PeakReversalConfig strategy_cfg = strategy_config_;
    std::string log_level = log_level_;
    std::string log_dir = log_dir_;

    try {
        if (j.contains("trading")) {
            const auto& t = j["trading"];
            engine_cfg.initial_cash = t.value("initial_cash", engine_cfg.initial_cash);
            engine_cfg.max_positions = t.value("max_positions", engine_cfg.max_positions);
            engine_cfg.fee = t.value("fee", engine_cfg.fee);
            engine_cfg.slippage = t.value("slippage", engine_cfg.slippage);
            engine_cfg.execution_delay_bars = t.value("execution_delay_bars", engine_cfg.execution_delay_bars);
            if (t.contains("crossing_policy")) {
                engine_cfg.crossing_policy = engine::parseCrossingPolicy(t["crossing_policy"].get<std::string>());
            }
            engine_cfg.random_seed = t.value("random_seed", engine_cfg.random_seed);
            engine_cfg.add_buy_pct = t.value("add_buy_pct", engine_cfg.add_buy_pct);
            engine_cfg.position_size_ratio = t.value("position_size_ratio", engine_cfg.position_size_ratio);
            engine_cfg.close_open_at_end = t.value("close_open_at_end", engine_cfg.close_open_at_end);
        }

        if (j.contains("strategy")) {
            const auto& s = j["strategy"];
            // Preset first so explicit window values below can override it
            if (s.contains("timeframe")) {
                strategy_cfg.applyTimeframePreset(strategy::parseTimeframe(s["timeframe"].get<std::string>()));
            }
            strategy_cfg.recent_window = s.value("recent_window", strategy_cfg.recent_window);
            strategy_cfg.total_window = s.value("total_window", strategy_cfg.total_window);
            strategy_cfg.pattern_buffer = s.value("pattern_buffer", strategy_cfg.pattern_buffer);
            strategy_cfg.tp_ratio = s.value("tp_ratio", strategy_cfg.tp_ratio);
            strategy_cfg.sl_ratio = s.value("sl_ratio", strategy_cfg.sl_ratio);
            strategy_cfg.ema_fast_period = s.value("ema_fast_period", strategy_cfg.ema_fast_period);
            strategy_cfg.ema_slow_period = s.value("ema_slow_period", strategy_cfg.ema_slow_period);
            strategy_cfg.peak_ema_period = s.value("peak_ema_period", strategy_cfg.peak_ema_period);
            strategy_cfg.peak_ema_multiple = s.value("peak_ema_multiple", strategy_cfg.peak_ema_multiple);
            strategy_cfg.min_history_bars = s.value("min_history_bars", strategy_cfg.min_history_bars);
            strategy_cfg.require_quality_gate = s.value("require_quality_gate", strategy_cfg.require_quality_gate);
            strategy_cfg.min_risk_reward = s.value("min_risk_reward", strategy_cfg.min_risk_reward);
            strategy_cfg.min_volume_ratio = s.value("min_volume_ratio", strategy_cfg.min_volume_ratio);
        }

        if (j.contains("universe")) {
            const auto& u = j["universe"];
            strategy_cfg.min_market_cap = u.value("min_market_cap", strategy_cfg.min_market_cap);
            strategy_cfg.max_market_cap = u.value("max_market_cap", strategy_cfg.max_market_cap);
            strategy_cfg.quote_asset = u.value("quote_asset", strategy_cfg.quote_asset);
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level = l.value("level", log_level);
            log_dir = l.value("dir", log_dir);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("bad value type: ") + e.what());
    }

    engine_cfg.validate();
    strategy_cfg.validate();

    engine_config_ = engine_cfg;
    strategy_config_ = strategy_cfg;
    log_level_ = log_level;
    log_dir_ = log_dir;
}

} // namespace peakrev
