#include "core/execution/TradeLifecycleStateMachine.h"
#include "common/Errors.h"

#include <algorithm>

namespace fvgscan {
namespace core {
namespace execution {

std::string toString(SameBarPolicy policy) {
    switch (policy) {
        case SameBarPolicy::STOP_LOSS_FIRST: return "stop_loss_first";
        case SameBarPolicy::TAKE_PROFIT_FIRST: return "take_profit_first";
    }
    return "stop_loss_first";
}

SameBarPolicy sameBarPolicyFromString(const std::string& value) {
    if (value == "stop_loss_first") return SameBarPolicy::STOP_LOSS_FIRST;
    if (value == "take_profit_first") return SameBarPolicy::TAKE_PROFIT_FIRST;
    throw ConfigError("unknown same_bar_policy: " + value);
}

BarEvaluation TradeLifecycleStateMachine::evaluateBar(
    const Trade& trade,
    const Candle& bar,
    Timeframe timeframe,
    const LifecycleConfig& config
) {
    BarEvaluation result;
    const Timestamp bar_close = bar.timestamp + timeframeDuration(timeframe);
    // the bar holding the open counts in full, extremes before the fill included
    if (isTerminal(trade.state) ||
        bar_close <= trade.open_time ||
        bar.timestamp <= trade.last_bar_time) {
        result.skipped = true;
        return result;
    }

    const bool is_buy = trade.direction == TradeDirection::BUY;
    const double sign = directionSign(trade.direction);

    const bool stop_hit = is_buy ? (bar.low <= trade.stop_loss) : (bar.high >= trade.stop_loss);
    const bool target_hit = is_buy ? (bar.high >= trade.take_profit) : (bar.low <= trade.take_profit);

    // excursions never extend past the levels that close the trade
    const double favorable = is_buy ? bar.high : bar.low;
    const double adverse = is_buy ? bar.low : bar.high;
    const double bar_mfe = std::min((favorable - trade.entry_price) * sign,
                                    (trade.take_profit - trade.entry_price) * sign);
    const double bar_mae = std::min((trade.entry_price - adverse) * sign,
                                    (trade.entry_price - trade.stop_loss) * sign);
    result.update.max_favorable_excursion = std::max({trade.max_favorable_excursion, bar_mfe, 0.0});
    result.update.max_adverse_excursion = std::max({trade.max_adverse_excursion, bar_mae, 0.0});
    result.update.last_bar_time = bar.timestamp;

    bool close_by_stop = stop_hit;
    bool close_by_target = target_hit && !stop_hit;
    if (stop_hit && target_hit && config.same_bar_policy == SameBarPolicy::TAKE_PROFIT_FIRST) {
        close_by_stop = false;
        close_by_target = true;
    }

    if (close_by_stop) {
        result.new_state = TradeState::CLOSED_BY_SL;
        result.update.close_price = trade.stop_loss;
        result.update.close_reason = std::string("stop loss touched");
    } else if (close_by_target) {
        result.new_state = TradeState::CLOSED_BY_TP;
        result.update.close_price = trade.take_profit;
        result.update.close_reason = std::string("take profit touched");
    } else if (bar_close - trade.open_time >= config.max_holding_ms) {
        result.new_state = TradeState::EXPIRED;
        result.update.close_price = bar.close;
        result.update.close_reason = std::string("max holding time elapsed");
    }

    if (result.new_state) {
        result.update.state = result.new_state;
        result.update.close_time = bar_close;
    }
    return result;
}

std::optional<TradeUpdate> TradeLifecycleStateMachine::evaluateExpiry(
    const Trade& trade,
    Timestamp now,
    double last_price,
    const LifecycleConfig& config
) {
    if (isTerminal(trade.state) || now - trade.open_time < config.max_holding_ms) {
        return std::nullopt;
    }
    TradeUpdate update;
    update.state = TradeState::EXPIRED;
    update.close_time = now;
    update.close_price = last_price;
    update.close_reason = std::string("max holding time elapsed");
    return update;
}

std::optional<TradeUpdate> TradeLifecycleStateMachine::evaluateAdjustment(
    const Trade& trade,
    const risk::SlTpAdjustment& adjustment,
    double current_price,
    Timestamp now
) {
    if (isTerminal(trade.state)) {
        return std::nullopt;
    }

    TradeUpdate update;
    if (adjustment.kind == risk::AdjustmentKind::CLOSE_EARLY) {
        update.state = TradeState::CLOSED_MANUAL;
        update.close_time = now;
        update.close_price = current_price;
        update.close_reason = adjustment.reason;
        return update;
    }

    const double new_stop = adjustment.new_stop_loss.value_or(trade.stop_loss);
    const double new_target = adjustment.new_take_profit.value_or(trade.take_profit);
    if (new_stop == trade.stop_loss && new_target == trade.take_profit) {
        return std::nullopt;
    }

    const double sign = directionSign(trade.direction);
    if ((current_price - new_stop) * sign <= 0.0) {
        throw InvariantViolation("adjusted stop " + std::to_string(new_stop) +
                                 " is not on the adverse side of price " + std::to_string(current_price));
    }
    if ((new_target - current_price) * sign <= 0.0) {
        throw InvariantViolation("adjusted target " + std::to_string(new_target) +
                                 " is not on the favorable side of price " + std::to_string(current_price));
    }

    update.stop_loss = new_stop;
    update.take_profit = new_target;
    return update;
}

NotificationType TradeLifecycleStateMachine::notificationFor(TradeState closed_state) {
    switch (closed_state) {
        case TradeState::CLOSED_BY_SL: return NotificationType::CLOSED_BY_SL;
        case TradeState::CLOSED_BY_TP: return NotificationType::CLOSED_BY_TP;
        case TradeState::CLOSED_MANUAL: return NotificationType::CLOSED_MANUAL;
        case TradeState::EXPIRED: return NotificationType::EXPIRED;
        case TradeState::OPEN: break;
    }
    throw InvariantViolation("no close notification for an open trade");
}

} // namespace execution
} // namespace core
} // namespace fvgscan
