#pragma once

#include <optional>
#include <string>

#include "core/model/TradeTypes.h"
#include "risk/IRiskEstimator.h"
#include "strategy/MultiTimeframeContext.h"

namespace fvgscan {
namespace strategy {

enum class TradeOutlook {
    CONTINUATION,   // favorable BOS/CHOCH since the open
    EXHAUSTION,     // adverse CHOCH since the open
    NEUTRAL
};

std::string toString(TradeOutlook outlook);

struct AdjustmentRecommendation {
    TradeOutlook outlook = TradeOutlook::NEUTRAL;
    risk::OpenTradeAnalytics analytics;
    std::string rationale;
};

struct StrategyInfo {
    std::string name;
    std::string description;
    std::string timeframe;      // timeframe that gates new signals
};

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // At most one signal per symbol per H4 close; nullopt when any stage fails
    virtual std::optional<core::Signal> evaluateNewSignal(const MultiTimeframeContext& ctx) const = 0;

    // Never mutates the trade
    virtual std::optional<AdjustmentRecommendation> evaluateOpenTrade(
        const core::Trade& trade,
        const MultiTimeframeContext& ctx
    ) const = 0;
};

} // namespace strategy
} // namespace fvgscan
