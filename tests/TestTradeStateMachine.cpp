#include "common/Errors.h"
#include "core/execution/TradeLifecycleManager.h"
#include "core/state/TradeStoreJson.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>

using namespace fvgscan;
using namespace fvgscan::core;
using namespace fvgscan::core::execution;
using namespace fvgscan::testsupport;

namespace {

// Loses every compare-and-set once armed, as if another writer got there first
class ContendedTradeStore : public TradeStoreJson {
public:
    bool contended = false;

    bool compareAndSetTrade(const std::string& trade_id, TradeState expected, const TradeUpdate& update) override {
        if (contended) {
            return false;
        }
        return TradeStoreJson::compareAndSetTrade(trade_id, expected, update);
    }
};

Candle m1(Timestamp offset_minutes, double open, double high, double low, double close) {
    return bar(kBaseTime + offset_minutes * kMinuteMs, open, high, low, close);
}

risk::SlTpAdjustment moveStop(double new_stop) {
    risk::SlTpAdjustment adjustment;
    adjustment.kind = risk::AdjustmentKind::MOVE_STOP;
    adjustment.rule = risk::AdjustmentRule::BREAK_EVEN;
    adjustment.new_stop_loss = new_stop;
    adjustment.reason = "test move";
    return adjustment;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting TradeStateMachine Test..." << std::endl;

    auto store = std::make_shared<TradeStoreJson>();
    auto sink = std::make_shared<RecordingSink>();
    TradeLifecycleManager manager(LifecycleConfig(), store, sink);

    // 1. Open emits SIGNAL_ACCEPTED and stores an OPEN trade
    const std::string sl_id = manager.openTrade(
        makeSignal("US30:1:BUY", TradeDirection::BUY, 1000.0, 950.0, 1100.0, kBaseTime));
    assert(sink->count(NotificationType::SIGNAL_ACCEPTED) == 1);
    assert(sink->events.back().trade_id == sl_id);
    assert(sink->events.back().payload["risk_plan"].contains("history_win_rate"));
    assert(store->getTrade(sl_id)->state == TradeState::OPEN);

    // 2. Stop touched -> CLOSED_BY_SL at the stop level and bar close time
    {
        const auto outcome = manager.onBar(sl_id, m1(1, 990, 1010, 940, 960), Timeframe::M1);
        assert(outcome == TransitionOutcome::APPLIED);
        const auto trade = store->getTrade(sl_id);
        assert(trade->state == TradeState::CLOSED_BY_SL);
        assert(trade->close_price == 950.0);
        assert(trade->close_time == kBaseTime + 2 * kMinuteMs);
        assert(sink->count(NotificationType::CLOSED_BY_SL) == 1);
        assert(near(sink->events.back().payload["r_multiple"].get<double>(), -1.0));

        // terminal: later bars change nothing and emit nothing
        const size_t before = sink->events.size();
        assert(manager.onBar(sl_id, m1(2, 960, 1200, 900, 1150), Timeframe::M1) == TransitionOutcome::NO_OP);
        assert(sink->events.size() == before);
        assert(store->getTrade(sl_id)->state == TradeState::CLOSED_BY_SL);
    }

    // 3. Both levels in one bar: stop wins by default, target with the opposite policy
    {
        const std::string id = manager.openTrade(
            makeSignal("XAU:2:SELL", TradeDirection::SELL, 2000.0, 2050.0, 1900.0, kBaseTime, "XAUUSD"));
        assert(manager.onBar(id, m1(1, 2000, 2060, 1890, 1950), Timeframe::M1) == TransitionOutcome::APPLIED);
        assert(store->getTrade(id)->state == TradeState::CLOSED_BY_SL);
        assert(store->getTrade(id)->close_price == 2050.0);

        LifecycleConfig tp_first;
        tp_first.same_bar_policy = SameBarPolicy::TAKE_PROFIT_FIRST;
        TradeLifecycleManager optimistic(tp_first, store, sink);
        const std::string other = optimistic.openTrade(
            makeSignal("XAU:3:SELL", TradeDirection::SELL, 2000.0, 2050.0, 1900.0, kBaseTime, "XAUUSD"));
        assert(optimistic.onBar(other, m1(1, 2000, 2060, 1890, 1950), Timeframe::M1) == TransitionOutcome::APPLIED);
        assert(store->getTrade(other)->state == TradeState::CLOSED_BY_TP);
        assert(store->getTrade(other)->close_price == 1900.0);
    }

    // 4. Excursions accumulate, bars are evaluated once, target closes exactly once
    {
        const std::string id = manager.openTrade(
            makeSignal("US30:4:BUY", TradeDirection::BUY, 1000.0, 950.0, 1100.0, kBaseTime));
        const Candle first = m1(1, 1000, 1050, 980, 1040);
        assert(manager.onBar(id, first, Timeframe::M1) == TransitionOutcome::NO_OP);
        auto trade = store->getTrade(id);
        assert(trade->state == TradeState::OPEN);
        assert(trade->max_favorable_excursion == 50.0);
        assert(trade->max_adverse_excursion == 20.0);
        assert(trade->last_bar_time == first.timestamp);

        // replaying the same bar is skipped
        const auto replay = TradeLifecycleStateMachine::evaluateBar(*trade, first, Timeframe::M1, LifecycleConfig());
        assert(replay.skipped);

        // bar before the open is ignored
        const auto early = TradeLifecycleStateMachine::evaluateBar(
            *trade, bar(kBaseTime - kMinuteMs, 1000, 1200, 900, 1000), Timeframe::M1, LifecycleConfig());
        assert(early.skipped);

        // opened mid-bar: the bar holding the open is evaluated and can stop the trade out
        const std::string mid_id = manager.openTrade(
            makeSignal("US30:4b:BUY", TradeDirection::BUY, 1000.0, 950.0, 1100.0, kBaseTime + 30 * 1000));
        assert(manager.onBar(mid_id, m1(0, 1000, 1005, 945, 990), Timeframe::M1) == TransitionOutcome::APPLIED);
        const auto stopped = store->getTrade(mid_id);
        assert(stopped->state == TradeState::CLOSED_BY_SL);
        assert(stopped->close_price == 950.0);
        assert(stopped->close_time == kBaseTime + kMinuteMs);

        assert(manager.onBar(id, m1(2, 1040, 1200, 1030, 1150), Timeframe::M1) == TransitionOutcome::APPLIED);
        assert(manager.onBar(id, m1(3, 1150, 1250, 1100, 1200), Timeframe::M1) == TransitionOutcome::NO_OP);
        trade = store->getTrade(id);
        assert(trade->state == TradeState::CLOSED_BY_TP);
        assert(trade->max_favorable_excursion == 100.0);
        assert(trade->max_adverse_excursion == 20.0);
        assert(sink->count(NotificationType::CLOSED_BY_TP) == 2);
    }

    // 5. Adjustments: applied, unchanged, rejected, early close
    {
        const std::string id = manager.openTrade(
            makeSignal("US30:5:BUY", TradeDirection::BUY, 1000.0, 950.0, 1100.0, kBaseTime));
        const Timestamp now = kBaseTime + 30 * kMinuteMs;

        assert(manager.applyAdjustment(id, moveStop(1000.0), 1060.0, now) == TransitionOutcome::APPLIED);
        assert(store->getTrade(id)->stop_loss == 1000.0);
        assert(store->getTrade(id)->initial_stop_loss == 950.0);
        const auto& event = sink->events.back();
        assert(event.type == NotificationType::ADJUSTMENT_APPLIED);
        assert(event.payload["old_stop_loss"].get<double>() == 950.0);
        assert(event.payload["new_stop_loss"].get<double>() == 1000.0);
        assert(event.payload["rule"].get<std::string>() == "break_even");

        const size_t before = sink->events.size();
        assert(manager.applyAdjustment(id, moveStop(1000.0), 1060.0, now) == TransitionOutcome::NO_OP);
        assert(manager.applyAdjustment(id, moveStop(1070.0), 1060.0, now) == TransitionOutcome::REJECTED);
        assert(sink->events.size() == before);
        assert(store->getTrade(id)->stop_loss == 1000.0);

        risk::SlTpAdjustment close_early;
        close_early.kind = risk::AdjustmentKind::CLOSE_EARLY;
        close_early.rule = risk::AdjustmentRule::TIME_EXIT;
        close_early.reason = "held too long";
        assert(manager.applyAdjustment(id, close_early, 1020.0, now) == TransitionOutcome::APPLIED);
        const auto trade = store->getTrade(id);
        assert(trade->state == TradeState::CLOSED_MANUAL);
        assert(trade->close_price == 1020.0);
        assert(trade->close_reason == "held too long");
        assert(sink->events.back().type == NotificationType::CLOSED_MANUAL);

        assert(manager.applyAdjustment(id, close_early, 1020.0, now) == TransitionOutcome::NO_OP);
    }

    // 6. Expiry by wall clock and by bar close
    {
        const std::string id = manager.openTrade(
            makeSignal("US30:6:BUY", TradeDirection::BUY, 1000.0, 950.0, 1100.0, kBaseTime));
        const DurationMs week = manager.config().max_holding_ms;
        assert(manager.checkExpiry(id, kBaseTime + week - 1, 1010.0) == TransitionOutcome::NO_OP);
        assert(manager.checkExpiry(id, kBaseTime + week, 1010.0) == TransitionOutcome::APPLIED);
        assert(store->getTrade(id)->state == TradeState::EXPIRED);
        assert(store->getTrade(id)->close_price == 1010.0);
        assert(sink->count(NotificationType::EXPIRED) == 1);

        LifecycleConfig short_hold;
        short_hold.max_holding_ms = 60 * kMinuteMs;
        TradeLifecycleManager impatient(short_hold, store, sink);
        const std::string other = impatient.openTrade(
            makeSignal("US30:7:BUY", TradeDirection::BUY, 1000.0, 950.0, 1100.0, kBaseTime));
        assert(impatient.onBar(other, m1(58, 1000, 1010, 990, 1005), Timeframe::M1) == TransitionOutcome::NO_OP);
        assert(impatient.onBar(other, m1(59, 1005, 1010, 990, 1002), Timeframe::M1) == TransitionOutcome::APPLIED);
        const auto trade = store->getTrade(other);
        assert(trade->state == TradeState::EXPIRED);
        assert(trade->close_price == 1002.0);
        assert(trade->close_time == kBaseTime + 60 * kMinuteMs);
    }

    // 7. Duplicate signal and invalid levels are refused
    {
        bool duplicate = false;
        try {
            manager.openTrade(makeSignal("US30:1:BUY", TradeDirection::BUY, 1000.0, 950.0, 1100.0, kBaseTime));
        } catch (const InvariantViolation&) {
            duplicate = true;
        }
        assert(duplicate);

        bool wrong_side = false;
        try {
            manager.openTrade(makeSignal("US30:8:BUY", TradeDirection::BUY, 1000.0, 1010.0, 1100.0, kBaseTime));
        } catch (const InvariantViolation&) {
            wrong_side = true;
        }
        assert(wrong_side);
    }

    // 8. Lost compare-and-set emits nothing
    {
        auto contended = std::make_shared<ContendedTradeStore>();
        auto quiet = std::make_shared<RecordingSink>();
        TradeLifecycleManager racing(LifecycleConfig(), contended, quiet);
        const std::string id = racing.openTrade(
            makeSignal("US30:9:BUY", TradeDirection::BUY, 1000.0, 950.0, 1100.0, kBaseTime));
        contended->contended = true;
        assert(racing.onBar(id, m1(1, 990, 1010, 940, 960), Timeframe::M1) == TransitionOutcome::CONFLICT);
        assert(racing.applyAdjustment(id, moveStop(1000.0), 1060.0, kBaseTime) == TransitionOutcome::CONFLICT);
        assert(quiet->events.size() == 1);
        assert(contended->getTrade(id)->state == TradeState::OPEN);
    }

    assert(manager.onBar("T999999", m1(1, 1, 1, 1, 1), Timeframe::M1) == TransitionOutcome::NOT_FOUND);
    assert(TradeLifecycleStateMachine::notificationFor(TradeState::EXPIRED) == NotificationType::EXPIRED);
    assert(sameBarPolicyFromString("take_profit_first") == SameBarPolicy::TAKE_PROFIT_FIRST);

    std::cout << "[TEST] TradeStateMachine Test PASSED!" << std::endl;
    return 0;
}
