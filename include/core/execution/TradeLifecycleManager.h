#pragma once

#include <memory>
#include <string>

#include "core/contracts/INotificationSink.h"
#include "core/contracts/IOutcomeStore.h"
#include "core/execution/TradeLifecycleStateMachine.h"

namespace fvgscan {
namespace core {
namespace execution {

enum class TransitionOutcome {
    APPLIED,        // written and notified
    NO_OP,          // nothing to notify (terminal trade, skipped bar, unchanged levels)
    CONFLICT,       // compare-and-set lost; nothing emitted
    REJECTED,       // adjustment would break level invariants
    NOT_FOUND
};

std::string toString(TransitionOutcome outcome);

// Persists state machine decisions with compare-and-set and emits exactly
// one notification per successful transition or applied adjustment.
class TradeLifecycleManager {
public:
    TradeLifecycleManager(
        LifecycleConfig config,
        std::shared_ptr<IOutcomeStore> store,
        std::shared_ptr<INotificationSink> sink
    );

    // Creates the OPEN trade and emits SIGNAL_ACCEPTED.
    // Throws InvariantViolation for invalid levels or a duplicate signal.
    std::string openTrade(const Signal& signal);

    TransitionOutcome onBar(const std::string& trade_id, const Candle& bar, Timeframe timeframe);

    TransitionOutcome applyAdjustment(
        const std::string& trade_id,
        const risk::SlTpAdjustment& adjustment,
        double current_price,
        Timestamp now
    );

    TransitionOutcome checkExpiry(const std::string& trade_id, Timestamp now, double last_price);

    const LifecycleConfig& config() const { return config_; }

private:
    void emitClose(const Trade& closed, Timestamp ts_ms);

    LifecycleConfig config_;
    std::shared_ptr<IOutcomeStore> store_;
    std::shared_ptr<INotificationSink> sink_;
};

} // namespace execution
} // namespace core
} // namespace fvgscan
