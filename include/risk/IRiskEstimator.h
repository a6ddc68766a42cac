#pragma once

#include <optional>
#include <string>

#include "common/CandleSeries.h"
#include "core/model/TradeTypes.h"
#include "risk/RiskConfig.h"

namespace fvgscan {
namespace risk {

struct SignalContext {
    std::string symbol;
    TradeDirection direction = TradeDirection::BUY;
    double entry_price = 0.0;
    CandleSeries h4;
    CandleSeries h1;
};

struct OpenTradeAnalytics {
    core::Trade trade;
    double current_price = 0.0;
    double atr_h4 = 0.0;
    DurationMs elapsed = 0;
    double unrealized_r = 0.0;
    bool has_new_favorable_structure = false;
    bool trend_exhausted = false;
};

enum class AdjustmentKind {
    MOVE_STOP,
    CLOSE_EARLY
};

struct SlTpAdjustment {
    AdjustmentKind kind = AdjustmentKind::MOVE_STOP;
    AdjustmentRule rule = AdjustmentRule::BREAK_EVEN;
    std::optional<double> new_stop_loss;
    std::optional<double> new_take_profit;
    std::string reason;
};

struct PositionSizing {
    double risk_amount = 0.0;
    double size = 0.0;
};

class IRiskEstimator {
public:
    virtual ~IRiskEstimator() = default;

    // Throws InvalidRiskPlan (stop distance, volatility, size) or
    // InvariantViolation (levels on the wrong side)
    virtual core::RiskPlan estimateForNewSignal(const SignalContext& ctx) = 0;

    virtual std::optional<SlTpAdjustment> evaluateAdjustment(const OpenTradeAnalytics& analytics) = 0;
};

} // namespace risk
} // namespace fvgscan
