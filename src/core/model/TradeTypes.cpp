#include "core/model/TradeTypes.h"
#include "common/Errors.h"

#include <cmath>

namespace fvgscan {
namespace core {

Trade Trade::fromSignal(const Signal& signal) {
    const RiskPlan& plan = signal.risk_plan;
    validateLevels(signal.direction, signal.entry_price, plan.stop_loss, plan.take_profit);
    if (signal.id.empty()) {
        throw InvariantViolation("trade requires a signal id");
    }

    Trade trade;
    trade.signal_id = signal.id;
    trade.symbol = signal.symbol;
    trade.direction = signal.direction;
    trade.entry_price = signal.entry_price;
    trade.initial_stop_loss = plan.stop_loss;
    trade.stop_loss = plan.stop_loss;
    trade.take_profit = plan.take_profit;
    trade.risk_plan = plan;
    trade.state = TradeState::OPEN;
    trade.open_time = signal.time;
    return trade;
}

double Trade::initialRisk() const {
    return std::abs(entry_price - initial_stop_loss);
}

double Trade::rMultipleAt(double price) const {
    const double risk = initialRisk();
    if (risk <= 0.0) {
        return 0.0;
    }
    return (price - entry_price) * directionSign(direction) / risk;
}

void TradeUpdate::applyTo(Trade& trade) const {
    if (state) trade.state = *state;
    if (stop_loss) trade.stop_loss = *stop_loss;
    if (take_profit) trade.take_profit = *take_profit;
    if (close_time) trade.close_time = *close_time;
    if (close_price) trade.close_price = *close_price;
    if (close_reason) trade.close_reason = *close_reason;
    if (max_favorable_excursion) trade.max_favorable_excursion = *max_favorable_excursion;
    if (max_adverse_excursion) trade.max_adverse_excursion = *max_adverse_excursion;
    if (last_bar_time) trade.last_bar_time = *last_bar_time;
}

ClosedTradeOutcome ClosedTradeOutcome::fromTrade(const Trade& trade) {
    ClosedTradeOutcome outcome;
    outcome.mae = trade.max_adverse_excursion;
    outcome.mfe = trade.max_favorable_excursion;
    outcome.r_multiple = trade.rMultipleAt(trade.close_price);
    outcome.holding_duration = trade.close_time - trade.open_time;
    outcome.final_state = trade.state;
    return outcome;
}

bool isTerminal(TradeState state) {
    switch (state) {
        case TradeState::OPEN: return false;
        case TradeState::CLOSED_BY_TP: return true;
        case TradeState::CLOSED_BY_SL: return true;
        case TradeState::CLOSED_MANUAL: return true;
        case TradeState::EXPIRED: return true;
    }
    return true;
}

std::string toString(TradeState state) {
    switch (state) {
        case TradeState::OPEN: return "Open";
        case TradeState::CLOSED_BY_TP: return "ClosedByTp";
        case TradeState::CLOSED_BY_SL: return "ClosedBySl";
        case TradeState::CLOSED_MANUAL: return "ClosedManual";
        case TradeState::EXPIRED: return "Expired";
    }
    return "Open";
}

TradeState tradeStateFromString(const std::string& value) {
    if (value == "Open") return TradeState::OPEN;
    if (value == "ClosedByTp") return TradeState::CLOSED_BY_TP;
    if (value == "ClosedBySl") return TradeState::CLOSED_BY_SL;
    if (value == "ClosedManual") return TradeState::CLOSED_MANUAL;
    if (value == "Expired") return TradeState::EXPIRED;
    throw InvariantViolation("unknown trade state: " + value);
}

std::string toString(NotificationType type) {
    switch (type) {
        case NotificationType::SIGNAL_ACCEPTED: return "SIGNAL_ACCEPTED";
        case NotificationType::ADJUSTMENT_APPLIED: return "ADJUSTMENT_APPLIED";
        case NotificationType::CLOSED_BY_SL: return "CLOSED_BY_SL";
        case NotificationType::CLOSED_BY_TP: return "CLOSED_BY_TP";
        case NotificationType::CLOSED_MANUAL: return "CLOSED_MANUAL";
        case NotificationType::EXPIRED: return "EXPIRED";
    }
    return "SIGNAL_ACCEPTED";
}

NotificationType notificationTypeFromString(const std::string& value) {
    if (value == "SIGNAL_ACCEPTED") return NotificationType::SIGNAL_ACCEPTED;
    if (value == "ADJUSTMENT_APPLIED") return NotificationType::ADJUSTMENT_APPLIED;
    if (value == "CLOSED_BY_SL") return NotificationType::CLOSED_BY_SL;
    if (value == "CLOSED_BY_TP") return NotificationType::CLOSED_BY_TP;
    if (value == "CLOSED_MANUAL") return NotificationType::CLOSED_MANUAL;
    if (value == "EXPIRED") return NotificationType::EXPIRED;
    throw InvariantViolation("unknown notification type: " + value);
}

std::string toString(TakeProfitSource source) {
    switch (source) {
        case TakeProfitSource::HISTORICAL_MFE: return "historical_mfe";
        case TakeProfitSource::FALLBACK_RR: return "fallback_rr";
    }
    return "fallback_rr";
}

void validateLevels(TradeDirection direction, double entry_price, double stop_loss, double take_profit) {
    if (!std::isfinite(entry_price) || !std::isfinite(stop_loss) || !std::isfinite(take_profit)) {
        throw InvariantViolation("trade levels must be finite");
    }
    const double sign = directionSign(direction);
    if ((entry_price - stop_loss) * sign <= 0.0) {
        throw InvariantViolation(
            "stop_loss " + std::to_string(stop_loss) + " is not on the adverse side of entry " +
            std::to_string(entry_price) + " for " + toString(direction)
        );
    }
    if ((take_profit - entry_price) * sign <= 0.0) {
        throw InvariantViolation(
            "take_profit " + std::to_string(take_profit) + " is not on the favorable side of entry " +
            std::to_string(entry_price) + " for " + toString(direction)
        );
    }
}

nlohmann::json toJson(const RiskPlan& plan) {
    nlohmann::json j;
    j["stop_loss"] = plan.stop_loss;
    j["take_profit"] = plan.take_profit;
    j["risk_amount"] = plan.risk_amount;
    j["size"] = plan.size;
    j["stop_distance"] = plan.stop_distance;
    j["reward_risk"] = plan.reward_risk;
    j["atr_h4"] = plan.atr_h4;
    j["atr_h1"] = plan.atr_h1;
    j["structural_level"] = plan.structural_level;
    j["take_profit_source"] = toString(plan.take_profit_source);
    j["history_samples"] = plan.history_samples;
    j["history_win_rate"] = plan.history_win_rate;
    j["history_median_mae"] = plan.history_median_mae;
    j["history_mean_r"] = plan.history_mean_r;
    return j;
}

RiskPlan riskPlanFromJson(const nlohmann::json& j) {
    RiskPlan plan;
    plan.stop_loss = j.value("stop_loss", 0.0);
    plan.take_profit = j.value("take_profit", 0.0);
    plan.risk_amount = j.value("risk_amount", 0.0);
    plan.size = j.value("size", 0.0);
    plan.stop_distance = j.value("stop_distance", 0.0);
    plan.reward_risk = j.value("reward_risk", 0.0);
    plan.atr_h4 = j.value("atr_h4", 0.0);
    plan.atr_h1 = j.value("atr_h1", 0.0);
    plan.structural_level = j.value("structural_level", 0.0);
    plan.take_profit_source = (j.value("take_profit_source", std::string("fallback_rr")) == "historical_mfe")
        ? TakeProfitSource::HISTORICAL_MFE
        : TakeProfitSource::FALLBACK_RR;
    plan.history_samples = j.value("history_samples", 0);
    plan.history_win_rate = j.value("history_win_rate", 0.0);
    plan.history_median_mae = j.value("history_median_mae", 0.0);
    plan.history_mean_r = j.value("history_mean_r", 0.0);
    return plan;
}

nlohmann::json toJson(const Trade& trade) {
    nlohmann::json j;
    j["id"] = trade.id;
    j["signal_id"] = trade.signal_id;
    j["symbol"] = trade.symbol;
    j["direction"] = toString(trade.direction);
    j["entry_price"] = trade.entry_price;
    j["initial_stop_loss"] = trade.initial_stop_loss;
    j["stop_loss"] = trade.stop_loss;
    j["take_profit"] = trade.take_profit;
    j["risk_plan"] = toJson(trade.risk_plan);
    j["state"] = toString(trade.state);
    j["open_time"] = trade.open_time;
    j["close_time"] = trade.close_time;
    j["close_price"] = trade.close_price;
    j["close_reason"] = trade.close_reason;
    j["mfe"] = trade.max_favorable_excursion;
    j["mae"] = trade.max_adverse_excursion;
    j["last_bar_time"] = trade.last_bar_time;
    return j;
}

Trade tradeFromJson(const nlohmann::json& j) {
    Trade trade;
    trade.id = j.value("id", std::string());
    trade.signal_id = j.value("signal_id", std::string());
    trade.symbol = j.value("symbol", std::string());
    trade.direction = directionFromString(j.value("direction", std::string("buy")));
    trade.entry_price = j.value("entry_price", 0.0);
    trade.initial_stop_loss = j.value("initial_stop_loss", 0.0);
    trade.stop_loss = j.value("stop_loss", 0.0);
    trade.take_profit = j.value("take_profit", 0.0);
    trade.risk_plan = riskPlanFromJson(j.value("risk_plan", nlohmann::json::object()));
    trade.state = tradeStateFromString(j.value("state", std::string("Open")));
    trade.open_time = j.value("open_time", 0LL);
    trade.close_time = j.value("close_time", 0LL);
    trade.close_price = j.value("close_price", 0.0);
    trade.close_reason = j.value("close_reason", std::string());
    trade.max_favorable_excursion = j.value("mfe", 0.0);
    trade.max_adverse_excursion = j.value("mae", 0.0);
    trade.last_bar_time = j.value("last_bar_time", 0LL);
    return trade;
}

} // namespace core
} // namespace fvgscan
