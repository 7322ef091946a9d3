#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace peakrev {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps the defaults; malformed or invalid content throws ConfigurationError
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // Restores built-in defaults
    void reset();

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    strategy::PeakReversalConfig getStrategyConfig() const { return strategy_config_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    void setInitialCash(double v) { engine_config_.initial_cash = v; }
    void setCrossingPolicy(engine::CrossingPolicy p) { engine_config_.crossing_policy = p; }
    void setRandomSeed(std::uint64_t seed) { engine_config_.random_seed = seed; }
    void setTimeframe(strategy::Timeframe tf) { strategy_config_.applyTimeframePreset(tf); }

private:
    Config() = default;

    engine::EngineConfig engine_config_;
    strategy::PeakReversalConfig strategy_config_ = strategy::PeakReversalConfig::weekly();
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
};

} // namespace peakrev
