#pragma once

#include <memory>

#include "analytics/StructureAnalyzer.h"
#include "core/contracts/IOutcomeStore.h"
#include "risk/HistoricalOutcomeStats.h"
#include "risk/IRiskEstimator.h"

namespace fvgscan {
namespace risk {

// Structural stop behind the nearest H4 swing plus an ATR buffer,
// target from historical MFE with a fixed reward:risk fallback.
class RiskEstimator : public IRiskEstimator {
public:
    RiskEstimator(
        RiskEstimatorConfig config,
        std::shared_ptr<core::IOutcomeStore> outcome_store,
        std::shared_ptr<const analytics::IStructureAnalyzer> structure_analyzer
    );

    core::RiskPlan estimateForNewSignal(const SignalContext& ctx) override;
    std::optional<SlTpAdjustment> evaluateAdjustment(const OpenTradeAnalytics& analytics) override;

    HistoricalOutcomeStats historicalStats(const std::string& symbol, TradeDirection direction);

    // risk_amount = equity * risk_fraction, size = risk_amount / (stop_distance * point_value).
    // Throws InvalidRiskPlan on a non-positive distance or a non-finite size.
    static PositionSizing calculatePositionSize(
        double equity,
        double risk_fraction,
        double stop_distance,
        double point_value
    );

    const RiskEstimatorConfig& config() const { return config_; }

private:
    double findStructuralLevel(const CandleSeries& h4, TradeDirection direction, double entry_price) const;

    std::optional<SlTpAdjustment> checkBreakEven(const OpenTradeAnalytics& analytics) const;
    std::optional<SlTpAdjustment> checkTrail(const OpenTradeAnalytics& analytics) const;
    std::optional<SlTpAdjustment> checkTimeExit(const OpenTradeAnalytics& analytics);
    std::optional<SlTpAdjustment> checkExhaustion(const OpenTradeAnalytics& analytics) const;

    RiskEstimatorConfig config_;
    std::shared_ptr<core::IOutcomeStore> outcome_store_;
    std::shared_ptr<const analytics::IStructureAnalyzer> structure_analyzer_;
};

} // namespace risk
} // namespace fvgscan
