#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace fvgscan {
namespace core {

enum class TakeProfitSource {
    HISTORICAL_MFE,     // entry +/- median MFE of matching closed trades
    FALLBACK_RR         // fixed multiple of the stop distance
};

struct RiskPlan {
    double stop_loss = 0.0;
    double take_profit = 0.0;
    double risk_amount = 0.0;
    double size = 0.0;
    double stop_distance = 0.0;
    double reward_risk = 0.0;
    double atr_h4 = 0.0;
    double atr_h1 = 0.0;
    double structural_level = 0.0;  // swing the stop is anchored behind
    TakeProfitSource take_profit_source = TakeProfitSource::FALLBACK_RR;
    int history_samples = 0;
    double history_win_rate = 0.0;
    double history_median_mae = 0.0;
    double history_mean_r = 0.0;
};

struct Signal {
    std::string id;                 // symbol:h4_bar_time:direction
    std::string symbol;
    TradeDirection direction = TradeDirection::BUY;
    Timestamp time = 0;
    Timestamp h4_bar_time = 0;      // H4 close that produced the signal
    double entry_price = 0.0;
    std::string strategy_name;
    std::string notes;
    double estimated_rr = 0.0;
    RiskPlan risk_plan;
};

enum class TradeState {
    OPEN,
    CLOSED_BY_TP,
    CLOSED_BY_SL,
    CLOSED_MANUAL,
    EXPIRED
};

struct Trade {
    std::string id;
    std::string signal_id;
    std::string symbol;
    TradeDirection direction = TradeDirection::BUY;
    double entry_price = 0.0;
    double initial_stop_loss = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    RiskPlan risk_plan;
    TradeState state = TradeState::OPEN;
    Timestamp open_time = 0;
    Timestamp close_time = 0;
    double close_price = 0.0;
    std::string close_reason;
    double max_favorable_excursion = 0.0;   // price units
    double max_adverse_excursion = 0.0;     // price units, positive
    Timestamp last_bar_time = 0;            // newest bar already evaluated, 0 before the first

    // Throws InvariantViolation when the signal's levels are on the wrong side
    static Trade fromSignal(const Signal& signal);

    double initialRisk() const;
    double rMultipleAt(double price) const;
};

// Field changes written by compare-and-set; unset fields are left untouched
struct TradeUpdate {
    std::optional<TradeState> state;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::optional<Timestamp> close_time;
    std::optional<double> close_price;
    std::optional<std::string> close_reason;
    std::optional<double> max_favorable_excursion;
    std::optional<double> max_adverse_excursion;
    std::optional<Timestamp> last_bar_time;

    void applyTo(Trade& trade) const;
};

struct ClosedTradeOutcome {
    double mae = 0.0;
    double mfe = 0.0;
    double r_multiple = 0.0;
    DurationMs holding_duration = 0;
    TradeState final_state = TradeState::CLOSED_MANUAL;

    static ClosedTradeOutcome fromTrade(const Trade& trade);
};

enum class NotificationType {
    SIGNAL_ACCEPTED,
    ADJUSTMENT_APPLIED,
    CLOSED_BY_SL,
    CLOSED_BY_TP,
    CLOSED_MANUAL,
    EXPIRED
};

struct NotificationEvent {
    NotificationType type = NotificationType::SIGNAL_ACCEPTED;
    std::string trade_id;
    std::string symbol;
    TradeDirection direction = TradeDirection::BUY;
    Timestamp ts_ms = 0;
    nlohmann::json payload;
};

bool isTerminal(TradeState state);
std::string toString(TradeState state);
TradeState tradeStateFromString(const std::string& value);
std::string toString(NotificationType type);
NotificationType notificationTypeFromString(const std::string& value);
std::string toString(TakeProfitSource source);

// Stop strictly adverse, target strictly favorable; throws InvariantViolation otherwise
void validateLevels(TradeDirection direction, double entry_price, double stop_loss, double take_profit);

nlohmann::json toJson(const RiskPlan& plan);
RiskPlan riskPlanFromJson(const nlohmann::json& j);
nlohmann::json toJson(const Trade& trade);
Trade tradeFromJson(const nlohmann::json& j);

} // namespace core
} // namespace fvgscan
