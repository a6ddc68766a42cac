#pragma once

#include <optional>
#include <string>

#include "common/Types.h"
#include "core/model/TradeTypes.h"
#include "risk/IRiskEstimator.h"

namespace fvgscan {
namespace core {
namespace execution {

enum class SameBarPolicy {
    STOP_LOSS_FIRST,
    TAKE_PROFIT_FIRST
};

std::string toString(SameBarPolicy policy);
SameBarPolicy sameBarPolicyFromString(const std::string& value);

struct LifecycleConfig {
    SameBarPolicy same_bar_policy = SameBarPolicy::STOP_LOSS_FIRST;
    DurationMs max_holding_ms = 7LL * 24 * 60 * 60 * 1000;
};

struct BarEvaluation {
    bool skipped = false;               // terminal trade, or bar already covered
    TradeUpdate update;                 // excursions, last_bar_time and close fields
    std::optional<TradeState> new_state;
};

// Pure transition rules; callers persist the returned update.
class TradeLifecycleStateMachine {
public:
    static BarEvaluation evaluateBar(
        const Trade& trade,
        const Candle& bar,
        Timeframe timeframe,
        const LifecycleConfig& config
    );

    static std::optional<TradeUpdate> evaluateExpiry(
        const Trade& trade,
        Timestamp now,
        double last_price,
        const LifecycleConfig& config
    );

    // nullopt when the adjustment changes nothing. Throws InvariantViolation
    // when a new stop or target sits on the wrong side of the current price.
    static std::optional<TradeUpdate> evaluateAdjustment(
        const Trade& trade,
        const risk::SlTpAdjustment& adjustment,
        double current_price,
        Timestamp now
    );

    static NotificationType notificationFor(TradeState closed_state);
};

} // namespace execution
} // namespace core
} // namespace fvgscan
