#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fvgscan {

namespace {
constexpr DurationMs kHourMs = 60LL * 60 * 1000;

std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

void requirePositive(double value, const std::string& key) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ConfigError(key + " must be positive, got " + std::to_string(value));
    }
}

void requireNonNegative(double value, const std::string& key) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ConfigError(key + " must not be negative, got " + std::to_string(value));
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    scanner_config_ = engine::ScannerConfig();
    cache_config_ = data::SeriesCacheConfig();
    structure_config_ = analytics::StructureConfig();
    fvg_config_ = analytics::FvgConfig();
    order_block_config_ = analytics::OrderBlockConfig();
    strategy_config_ = strategy::H4ZoneStrategyConfig();
    risk_config_ = risk::RiskEstimatorConfig();
    lifecycle_config_ = core::execution::LifecycleConfig();
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

    // logger is configured from this file, so report on stdout
    std::cout << "config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "warning: config file not found, using defaults" << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("malformed config " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "config loaded: " << scanner_config_.symbols.size() << " symbols" << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    try {
        if (j.contains("scanner")) {
            const auto& s = j["scanner"];
            auto& c = scanner_config_;

            if (s.contains("symbols")) {
                c.symbols.clear();
                for (const auto& item : s["symbols"]) {
                    engine::SymbolMapping mapping;
                    if (item.is_string()) {
                        mapping.alias = item.get<std::string>();
                        mapping.data_symbol = mapping.alias;
                    } else {
                        mapping.alias = item.value("alias", std::string());
                        mapping.data_symbol = item.value("data_symbol", mapping.alias);
                    }
                    c.symbols.push_back(mapping);
                }
            }

            c.scan_interval_seconds = s.value("scan_interval_seconds", c.scan_interval_seconds);
            c.parallel_symbols = s.value("parallel_symbols", c.parallel_symbols);
            c.max_conflict_retries = s.value("max_conflict_retries", c.max_conflict_retries);
            if (s.contains("tracking_timeframe")) {
                c.tracking_timeframe = timeframeFromString(s["tracking_timeframe"].get<std::string>());
            }
            if (s.contains("history_days")) {
                for (const auto& [key, value] : s["history_days"].items()) {
                    c.history_days[timeframeFromString(key)] = value.get<int>();
                }
            }
            c.data_dir = s.value("data_dir", c.data_dir);
            c.trade_store_path = s.value("trade_store_path", c.trade_store_path);
            c.journal_path = s.value("journal_path", c.journal_path);
        }

        if (j.contains("cache")) {
            const auto& s = j["cache"];
            cache_config_.max_entries = s.value("max_entries", cache_config_.max_entries);
            cache_config_.max_bars_per_series = s.value("max_bars_per_series", cache_config_.max_bars_per_series);
            cache_config_.ttl_ms = s.value("ttl_ms", cache_config_.ttl_ms);
        }

        if (j.contains("structure")) {
            structure_config_.swing_window = j["structure"].value("swing_window", structure_config_.swing_window);
        }

        if (j.contains("fvg")) {
            fvg_config_.lookback = j["fvg"].value("lookback", fvg_config_.lookback);
        }

        if (j.contains("order_block")) {
            const auto& s = j["order_block"];
            auto& c = order_block_config_;
            c.atr_period = s.value("atr_period", c.atr_period);
            c.move_bars = s.value("move_bars", c.move_bars);
            c.strength_multiplier = s.value("strength_multiplier", c.strength_multiplier);
            c.lookback = s.value("lookback", c.lookback);
        }

        if (j.contains("strategy")) {
            const auto& s = j["strategy"];
            auto& c = strategy_config_;
            c.name = s.value("name", c.name);
            c.h4_zone_lookback = s.value("h4_zone_lookback", c.h4_zone_lookback);
            c.structure_lookback = s.value("structure_lookback", c.structure_lookback);
            c.entry_lookback = s.value("entry_lookback", c.entry_lookback);
            c.micro_structure_lookback = s.value("micro_structure_lookback", c.micro_structure_lookback);
            c.wick_body_ratio = s.value("wick_body_ratio", c.wick_body_ratio);
            c.atr_period = s.value("atr_period", c.atr_period);
        }

        if (j.contains("risk")) {
            const auto& s = j["risk"];
            auto& c = risk_config_;
            c.atr_period = s.value("atr_period", c.atr_period);
            c.stop_atr_multiplier = s.value("stop_atr_multiplier", c.stop_atr_multiplier);
            c.swing_lookback = s.value("swing_lookback", c.swing_lookback);
            c.fallback_swing_pct = s.value("fallback_swing_pct", c.fallback_swing_pct);
            c.min_history_samples = s.value("min_history_samples", c.min_history_samples);
            c.fallback_reward_risk = s.value("fallback_reward_risk", c.fallback_reward_risk);
            c.equity = s.value("equity", c.equity);
            c.risk_fraction = s.value("risk_fraction", c.risk_fraction);
            c.point_value = s.value("point_value", c.point_value);
            c.breakeven_r = s.value("breakeven_r", c.breakeven_r);
            c.trail_r = s.value("trail_r", c.trail_r);
            c.trail_atr_fraction = s.value("trail_atr_fraction", c.trail_atr_fraction);
            c.time_exit_factor = s.value("time_exit_factor", c.time_exit_factor);
            if (s.contains("rule_order")) {
                c.rule_order.clear();
                for (const auto& rule : s["rule_order"]) {
                    c.rule_order.push_back(risk::adjustmentRuleFromString(rule.get<std::string>()));
                }
            }
        }

        if (j.contains("lifecycle")) {
            const auto& s = j["lifecycle"];
            if (s.contains("same_bar_policy")) {
                lifecycle_config_.same_bar_policy =
                    core::execution::sameBarPolicyFromString(s["same_bar_policy"].get<std::string>());
            }
            if (s.contains("max_holding_hours")) {
                lifecycle_config_.max_holding_ms =
                    static_cast<DurationMs>(s["max_holding_hours"].get<double>() * static_cast<double>(kHourMs));
            }
        }

        if (j.contains("logging")) {
            log_level_ = j["logging"].value("level", log_level_);
            log_dir_ = j["logging"].value("dir", log_dir_);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("config value has the wrong type: ") + e.what());
    }

    applyEnvironmentOverrides();
    validate();
}

void Config::applyEnvironmentOverrides() {
    const std::string symbols = readEnvVar("FVGSCAN_SYMBOLS");
    if (!symbols.empty()) {
        scanner_config_.symbols = parseSymbolList(symbols);
    }
}

std::vector<engine::SymbolMapping> Config::parseSymbolList(const std::string& value) {
    std::vector<engine::SymbolMapping> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trimCopy(item);
        if (item.empty()) {
            continue;
        }
        engine::SymbolMapping mapping;
        const auto colon = item.find(':');
        if (colon == std::string::npos) {
            mapping.alias = item;
            mapping.data_symbol = item;
        } else {
            mapping.alias = trimCopy(item.substr(0, colon));
            mapping.data_symbol = trimCopy(item.substr(colon + 1));
        }
        if (mapping.alias.empty() || mapping.data_symbol.empty()) {
            throw ConfigError("bad symbol entry: " + item);
        }
        out.push_back(mapping);
    }
    return out;
}

void Config::validate() const {
    if (scanner_config_.symbols.empty()) {
        throw ConfigError("scanner.symbols must not be empty");
    }
    for (const auto& mapping : scanner_config_.symbols) {
        if (mapping.alias.empty() || mapping.data_symbol.empty()) {
            throw ConfigError("scanner.symbols entries need an alias and a data symbol");
        }
    }
    requirePositive(scanner_config_.scan_interval_seconds, "scanner.scan_interval_seconds");
    requireNonNegative(scanner_config_.max_conflict_retries, "scanner.max_conflict_retries");
    for (const auto& [tf, days] : scanner_config_.history_days) {
        requirePositive(days, "scanner.history_days." + toString(tf));
    }

    requirePositive(structure_config_.swing_window, "structure.swing_window");
    requireNonNegative(fvg_config_.lookback, "fvg.lookback");

    requirePositive(order_block_config_.atr_period, "order_block.atr_period");
    requirePositive(order_block_config_.move_bars, "order_block.move_bars");
    requirePositive(order_block_config_.strength_multiplier, "order_block.strength_multiplier");
    requireNonNegative(order_block_config_.lookback, "order_block.lookback");

    requirePositive(strategy_config_.h4_zone_lookback, "strategy.h4_zone_lookback");
    requirePositive(strategy_config_.structure_lookback, "strategy.structure_lookback");
    requirePositive(strategy_config_.entry_lookback, "strategy.entry_lookback");
    requirePositive(strategy_config_.micro_structure_lookback, "strategy.micro_structure_lookback");
    requirePositive(strategy_config_.wick_body_ratio, "strategy.wick_body_ratio");
    requirePositive(strategy_config_.atr_period, "strategy.atr_period");

    requirePositive(risk_config_.atr_period, "risk.atr_period");
    requirePositive(risk_config_.stop_atr_multiplier, "risk.stop_atr_multiplier");
    requirePositive(risk_config_.swing_lookback, "risk.swing_lookback");
    requireNonNegative(risk_config_.fallback_swing_pct, "risk.fallback_swing_pct");
    requireNonNegative(risk_config_.min_history_samples, "risk.min_history_samples");
    requirePositive(risk_config_.fallback_reward_risk, "risk.fallback_reward_risk");
    requirePositive(risk_config_.equity, "risk.equity");
    requirePositive(risk_config_.point_value, "risk.point_value");
    requirePositive(risk_config_.breakeven_r, "risk.breakeven_r");
    requirePositive(risk_config_.trail_r, "risk.trail_r");
    requirePositive(risk_config_.trail_atr_fraction, "risk.trail_atr_fraction");
    requirePositive(risk_config_.time_exit_factor, "risk.time_exit_factor");
    if (!(risk_config_.risk_fraction > 0.0 && risk_config_.risk_fraction < 1.0)) {
        throw ConfigError("risk.risk_fraction must be in (0, 1)");
    }

    requirePositive(static_cast<double>(lifecycle_config_.max_holding_ms), "lifecycle.max_holding_hours");
}

} // namespace fvgscan
