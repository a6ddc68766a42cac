#include "core/execution/TradeLifecycleManager.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace fvgscan {
namespace core {
namespace execution {

std::string toString(TransitionOutcome outcome) {
    switch (outcome) {
        case TransitionOutcome::APPLIED: return "applied";
        case TransitionOutcome::NO_OP: return "no_op";
        case TransitionOutcome::CONFLICT: return "conflict";
        case TransitionOutcome::REJECTED: return "rejected";
        case TransitionOutcome::NOT_FOUND: return "not_found";
    }
    return "no_op";
}

TradeLifecycleManager::TradeLifecycleManager(
    LifecycleConfig config,
    std::shared_ptr<IOutcomeStore> store,
    std::shared_ptr<INotificationSink> sink
)
    : config_(config)
    , store_(std::move(store))
    , sink_(std::move(sink))
{
    if (!store_ || !sink_) {
        throw InvariantViolation("TradeLifecycleManager requires a store and a notification sink");
    }
}

std::string TradeLifecycleManager::openTrade(const Signal& signal) {
    Trade trade = Trade::fromSignal(signal);
    trade.id = store_->createTrade(trade);

    NotificationEvent event;
    event.type = NotificationType::SIGNAL_ACCEPTED;
    event.trade_id = trade.id;
    event.symbol = trade.symbol;
    event.direction = trade.direction;
    event.ts_ms = signal.time;
    event.payload = {
        {"signal_id", signal.id},
        {"strategy", signal.strategy_name},
        {"entry_price", signal.entry_price},
        {"stop_loss", trade.stop_loss},
        {"take_profit", trade.take_profit},
        {"h4_bar_time", signal.h4_bar_time},
        {"notes", signal.notes},
        {"risk_plan", toJson(signal.risk_plan)}
    };
    sink_->emit(event);

    LOG_INFO("{} trade {} opened {} @ {:.5f} (SL {:.5f}, TP {:.5f})",
             trade.symbol, trade.id, toString(trade.direction),
             trade.entry_price, trade.stop_loss, trade.take_profit);
    return trade.id;
}

TransitionOutcome TradeLifecycleManager::onBar(
    const std::string& trade_id,
    const Candle& bar,
    Timeframe timeframe
) {
    const auto trade = store_->getTrade(trade_id);
    if (!trade) {
        return TransitionOutcome::NOT_FOUND;
    }

    const BarEvaluation evaluation = TradeLifecycleStateMachine::evaluateBar(*trade, bar, timeframe, config_);
    if (evaluation.skipped) {
        return TransitionOutcome::NO_OP;
    }

    if (!store_->compareAndSetTrade(trade_id, TradeState::OPEN, evaluation.update)) {
        LOG_WARN("trade {} changed while evaluating bar {}", trade_id, bar.timestamp);
        return TransitionOutcome::CONFLICT;
    }
    if (!evaluation.new_state) {
        return TransitionOutcome::NO_OP;
    }

    Trade closed = *trade;
    evaluation.update.applyTo(closed);
    emitClose(closed, *evaluation.update.close_time);
    return TransitionOutcome::APPLIED;
}

TransitionOutcome TradeLifecycleManager::applyAdjustment(
    const std::string& trade_id,
    const risk::SlTpAdjustment& adjustment,
    double current_price,
    Timestamp now
) {
    const auto trade = store_->getTrade(trade_id);
    if (!trade) {
        return TransitionOutcome::NOT_FOUND;
    }

    std::optional<TradeUpdate> update;
    try {
        update = TradeLifecycleStateMachine::evaluateAdjustment(*trade, adjustment, current_price, now);
    } catch (const InvariantViolation& e) {
        LOG_ERROR("trade {} adjustment rejected: {}", trade_id, e.what());
        return TransitionOutcome::REJECTED;
    }
    if (!update) {
        return TransitionOutcome::NO_OP;
    }

    if (!store_->compareAndSetTrade(trade_id, TradeState::OPEN, *update)) {
        LOG_WARN("trade {} changed before adjustment could be applied", trade_id);
        return TransitionOutcome::CONFLICT;
    }

    Trade adjusted = *trade;
    update->applyTo(adjusted);
    if (update->state) {
        emitClose(adjusted, now);
        return TransitionOutcome::APPLIED;
    }

    NotificationEvent event;
    event.type = NotificationType::ADJUSTMENT_APPLIED;
    event.trade_id = trade_id;
    event.symbol = adjusted.symbol;
    event.direction = adjusted.direction;
    event.ts_ms = now;
    event.payload = {
        {"old_stop_loss", trade->stop_loss},
        {"new_stop_loss", adjusted.stop_loss},
        {"old_take_profit", trade->take_profit},
        {"new_take_profit", adjusted.take_profit},
        {"rule", risk::toString(adjustment.rule)},
        {"reason", adjustment.reason}
    };
    sink_->emit(event);

    LOG_INFO("{} trade {} adjusted: SL {:.5f} -> {:.5f}, TP {:.5f} -> {:.5f} ({})",
             adjusted.symbol, trade_id, trade->stop_loss, adjusted.stop_loss,
             trade->take_profit, adjusted.take_profit, adjustment.reason);
    return TransitionOutcome::APPLIED;
}

TransitionOutcome TradeLifecycleManager::checkExpiry(
    const std::string& trade_id,
    Timestamp now,
    double last_price
) {
    const auto trade = store_->getTrade(trade_id);
    if (!trade) {
        return TransitionOutcome::NOT_FOUND;
    }

    const auto update = TradeLifecycleStateMachine::evaluateExpiry(*trade, now, last_price, config_);
    if (!update) {
        return TransitionOutcome::NO_OP;
    }
    if (!store_->compareAndSetTrade(trade_id, TradeState::OPEN, *update)) {
        LOG_WARN("trade {} changed before expiry could be recorded", trade_id);
        return TransitionOutcome::CONFLICT;
    }

    Trade expired = *trade;
    update->applyTo(expired);
    emitClose(expired, now);
    return TransitionOutcome::APPLIED;
}

void TradeLifecycleManager::emitClose(const Trade& closed, Timestamp ts_ms) {
    const double r_multiple = closed.rMultipleAt(closed.close_price);

    NotificationEvent event;
    event.type = TradeLifecycleStateMachine::notificationFor(closed.state);
    event.trade_id = closed.id;
    event.symbol = closed.symbol;
    event.direction = closed.direction;
    event.ts_ms = ts_ms;
    event.payload = {
        {"entry_price", closed.entry_price},
        {"close_price", closed.close_price},
        {"stop_loss", closed.stop_loss},
        {"take_profit", closed.take_profit},
        {"r_multiple", r_multiple},
        {"holding_ms", closed.close_time - closed.open_time},
        {"mfe", closed.max_favorable_excursion},
        {"mae", closed.max_adverse_excursion},
        {"reason", closed.close_reason}
    };
    sink_->emit(event);

    LOG_INFO("{} trade {} {} @ {:.5f} ({:.2f}R)",
             closed.symbol, closed.id, toString(closed.state), closed.close_price, r_multiple);
    Logger::getInstance().logTrade(closed.symbol, toString(closed.direction),
                                   closed.entry_price, closed.close_price, r_multiple,
                                   closed.close_reason);
}

} // namespace execution
} // namespace core
} // namespace fvgscan
