#pragma once

#include <string>
#include <vector>

namespace fvgscan {
namespace risk {

// Open-trade adjustment rules, evaluated in the configured order; first match wins
enum class AdjustmentRule {
    BREAK_EVEN,         // unrealized R >= breakeven_r: stop to entry
    TRAIL,              // unrealized R >= trail_r: stop trails price by a fraction of ATR
    TIME_EXIT,          // held longer than winners usually are, without new favorable structure
    EXHAUSTION_EXIT     // adverse CHOCH since the open
};

std::string toString(AdjustmentRule rule);
AdjustmentRule adjustmentRuleFromString(const std::string& value);

struct RiskEstimatorConfig {
    int atr_period = 14;
    double stop_atr_multiplier = 1.5;       // k
    int swing_lookback = 50;                // H4 bars searched for the structural stop
    double fallback_swing_pct = 0.02;       // used when no swing sits beyond entry
    int min_history_samples = 10;
    double fallback_reward_risk = 2.0;
    double equity = 10000.0;
    double risk_fraction = 0.01;
    double point_value = 1.0;               // account currency per price unit per unit size

    double breakeven_r = 1.0;
    double trail_r = 2.0;
    double trail_atr_fraction = 1.0;
    double time_exit_factor = 1.5;
    std::vector<AdjustmentRule> rule_order = {
        AdjustmentRule::BREAK_EVEN,
        AdjustmentRule::TRAIL,
        AdjustmentRule::TIME_EXIT
    };
};

} // namespace risk
} // namespace fvgscan
