#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/FvgDetector.h"
#include "analytics/OrderBlockDetector.h"
#include "analytics/StructureAnalyzer.h"
#include "core/execution/TradeLifecycleStateMachine.h"
#include "data/SeriesCache.h"
#include "engine/EngineConfig.h"
#include "risk/RiskConfig.h"
#include "strategy/StrategyConfig.h"

namespace fvgscan {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults. Throws ConfigError on malformed JSON or invalid values.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // FVGSCAN_SYMBOLS="US30:^DJI,XAUUSD:GC=F,EURUSD"
    void applyEnvironmentOverrides();

    void validate() const;
    void resetToDefaults();

    static std::vector<engine::SymbolMapping> parseSymbolList(const std::string& value);

    engine::ScannerConfig getScannerConfig() const { return scanner_config_; }
    data::SeriesCacheConfig getSeriesCacheConfig() const { return cache_config_; }
    analytics::StructureConfig getStructureConfig() const { return structure_config_; }
    analytics::FvgConfig getFvgConfig() const { return fvg_config_; }
    analytics::OrderBlockConfig getOrderBlockConfig() const { return order_block_config_; }
    strategy::H4ZoneStrategyConfig getStrategyConfig() const { return strategy_config_; }
    risk::RiskEstimatorConfig getRiskConfig() const { return risk_config_; }
    core::execution::LifecycleConfig getLifecycleConfig() const { return lifecycle_config_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

private:
    Config() = default;

    engine::ScannerConfig scanner_config_;
    data::SeriesCacheConfig cache_config_;
    analytics::StructureConfig structure_config_;
    analytics::FvgConfig fvg_config_;
    analytics::OrderBlockConfig order_block_config_;
    strategy::H4ZoneStrategyConfig strategy_config_;
    risk::RiskEstimatorConfig risk_config_;
    core::execution::LifecycleConfig lifecycle_config_;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
};

} // namespace fvgscan
