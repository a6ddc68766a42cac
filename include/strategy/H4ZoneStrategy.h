#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analytics/FvgDetector.h"
#include "analytics/OrderBlockDetector.h"
#include "analytics/StructureAnalyzer.h"
#include "risk/IRiskEstimator.h"
#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace fvgscan {
namespace strategy {

// Unfilled H4 zone that sets the bias
struct BiasZone {
    MarketBias bias = MarketBias::BULLISH;
    double high = 0.0;
    double low = 0.0;
    std::string source;         // "FVG" or "OB"
    size_t origin_index = 0;
    Timestamp origin_timestamp = 0;
};

// H4 zone bias -> H1/M30/M15 structure confirmation -> M5/M1 entry trigger
class H4ZoneStrategy : public IStrategy {
public:
    H4ZoneStrategy(
        H4ZoneStrategyConfig config,
        std::shared_ptr<const analytics::IStructureAnalyzer> structure_analyzer,
        std::shared_ptr<const analytics::IFvgDetector> fvg_detector,
        std::shared_ptr<const analytics::IOrderBlockDetector> order_block_detector,
        std::shared_ptr<risk::IRiskEstimator> risk_estimator
    );

    StrategyInfo getInfo() const override;

    std::optional<core::Signal> evaluateNewSignal(const MultiTimeframeContext& ctx) const override;
    std::optional<AdjustmentRecommendation> evaluateOpenTrade(
        const core::Trade& trade,
        const MultiTimeframeContext& ctx
    ) const override;

    std::optional<BiasZone> determineBias(const CandleSeries& h4) const;

    // Name of the first confirming timeframe event, e.g. "H1 BOS"
    std::vector<std::string> findStructureConfirmations(
        const std::map<Timeframe, CandleSeries>& closed,
        MarketBias bias
    ) const;

    std::optional<std::string> findEntryTrigger(
        const CandleSeries& series,
        const BiasZone& zone
    ) const;

private:
    // Closed-bar slices of the requested timeframes. Throws DataInsufficient
    // when any is missing or shorter than a swing window, or there is no price.
    std::map<Timeframe, CandleSeries> closedSeries(
        const MultiTimeframeContext& ctx,
        const std::vector<Timeframe>& timeframes
    ) const;

    bool isWickRejection(const Candle& bar, const BiasZone& zone) const;

    H4ZoneStrategyConfig config_;
    std::shared_ptr<const analytics::IStructureAnalyzer> structure_analyzer_;
    std::shared_ptr<const analytics::IFvgDetector> fvg_detector_;
    std::shared_ptr<const analytics::IOrderBlockDetector> order_block_detector_;
    std::shared_ptr<risk::IRiskEstimator> risk_estimator_;
};

} // namespace strategy
} // namespace fvgscan
