#include "risk/RiskEstimator.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace fvgscan {
namespace risk {

std::string toString(AdjustmentRule rule) {
    switch (rule) {
        case AdjustmentRule::BREAK_EVEN: return "break_even";
        case AdjustmentRule::TRAIL: return "trail";
        case AdjustmentRule::TIME_EXIT: return "time_exit";
        case AdjustmentRule::EXHAUSTION_EXIT: return "exhaustion_exit";
    }
    return "break_even";
}

AdjustmentRule adjustmentRuleFromString(const std::string& value) {
    if (value == "break_even") return AdjustmentRule::BREAK_EVEN;
    if (value == "trail") return AdjustmentRule::TRAIL;
    if (value == "time_exit") return AdjustmentRule::TIME_EXIT;
    if (value == "exhaustion_exit") return AdjustmentRule::EXHAUSTION_EXIT;
    throw ConfigError("unknown adjustment rule: " + value);
}

RiskEstimator::RiskEstimator(
    RiskEstimatorConfig config,
    std::shared_ptr<core::IOutcomeStore> outcome_store,
    std::shared_ptr<const analytics::IStructureAnalyzer> structure_analyzer
)
    : config_(std::move(config))
    , outcome_store_(std::move(outcome_store))
    , structure_analyzer_(std::move(structure_analyzer))
{
    if (!structure_analyzer_) {
        throw InvariantViolation("RiskEstimator requires a structure analyzer");
    }
}

// ===== New signal =====

core::RiskPlan RiskEstimator::estimateForNewSignal(const SignalContext& ctx) {
    if (!std::isfinite(ctx.entry_price) || ctx.entry_price <= 0.0) {
        throw InvalidRiskPlan(ctx.symbol + ": entry price must be positive");
    }
    const double sign = directionSign(ctx.direction);

    // 1) volatility
    const double atr_h4 = analytics::TechnicalIndicators::calculateATR(ctx.h4.candles(), config_.atr_period);
    const double atr_h1 = analytics::TechnicalIndicators::calculateATR(ctx.h1.candles(), config_.atr_period);
    const double buffer_atr = (atr_h4 > 0.0) ? atr_h4 : atr_h1;
    if (!(buffer_atr > 0.0)) {
        throw InvalidRiskPlan(ctx.symbol + ": no usable ATR on H4 or H1");
    }
    if (atr_h4 <= 0.0) {
        LOG_WARN("{} H4 ATR unavailable ({} bars), buffering with H1 ATR {:.5f}",
                 ctx.symbol, ctx.h4.size(), atr_h1);
    }

    // 2) structural stop
    const double structural_level = findStructuralLevel(ctx.h4, ctx.direction, ctx.entry_price);
    const double stop_loss = structural_level - sign * config_.stop_atr_multiplier * buffer_atr;
    const double stop_distance = (ctx.entry_price - stop_loss) * sign;
    if (!std::isfinite(stop_distance) || stop_distance <= 0.0) {
        throw InvalidRiskPlan(
            ctx.symbol + ": stop " + std::to_string(stop_loss) +
            " leaves no distance to entry " + std::to_string(ctx.entry_price)
        );
    }

    // 3) target
    const HistoricalOutcomeStats stats = historicalStats(ctx.symbol, ctx.direction);
    core::RiskPlan plan;
    if (stats.sample_count >= config_.min_history_samples && stats.median_mfe > 0.0) {
        plan.take_profit = ctx.entry_price + sign * stats.median_mfe;
        plan.take_profit_source = core::TakeProfitSource::HISTORICAL_MFE;
    } else {
        plan.take_profit = ctx.entry_price + sign * config_.fallback_reward_risk * stop_distance;
        plan.take_profit_source = core::TakeProfitSource::FALLBACK_RR;
    }

    // 4) sizing
    const PositionSizing sizing = calculatePositionSize(
        config_.equity, config_.risk_fraction, stop_distance, config_.point_value);

    plan.stop_loss = stop_loss;
    plan.stop_distance = stop_distance;
    plan.risk_amount = sizing.risk_amount;
    plan.size = sizing.size;
    plan.reward_risk = std::abs(plan.take_profit - ctx.entry_price) / stop_distance;
    plan.atr_h4 = atr_h4;
    plan.atr_h1 = atr_h1;
    plan.structural_level = structural_level;
    plan.history_samples = stats.sample_count;
    plan.history_win_rate = stats.winRate();
    plan.history_median_mae = stats.median_mae;
    plan.history_mean_r = stats.mean_r;

    core::validateLevels(ctx.direction, ctx.entry_price, plan.stop_loss, plan.take_profit);

    LOG_INFO("{} {} plan: entry {:.5f}, SL {:.5f}, TP {:.5f} ({}), RR {:.2f}, size {:.4f}, history {} (win {:.0f}%)",
             ctx.symbol, toString(ctx.direction), ctx.entry_price, plan.stop_loss,
             plan.take_profit, core::toString(plan.take_profit_source), plan.reward_risk, plan.size,
             plan.history_samples, plan.history_win_rate * 100.0);
    return plan;
}

double RiskEstimator::findStructuralLevel(
    const CandleSeries& h4,
    TradeDirection direction,
    double entry_price
) const {
    const size_t lookback = static_cast<size_t>(std::max(config_.swing_lookback, 0));
    const size_t min_index = (h4.size() > lookback) ? h4.size() - lookback : 0;
    const auto swings = structure_analyzer_->findSwings(h4);

    bool found = false;
    double level = 0.0;
    for (const auto& swing : swings) {
        if (swing.index < min_index) {
            continue;
        }
        if (direction == TradeDirection::BUY) {
            if (swing.kind == analytics::SwingKind::LOW && swing.price < entry_price &&
                (!found || swing.price > level)) {
                level = swing.price;
                found = true;
            }
        } else {
            if (swing.kind == analytics::SwingKind::HIGH && swing.price > entry_price &&
                (!found || swing.price < level)) {
                level = swing.price;
                found = true;
            }
        }
    }

    if (!found) {
        level = entry_price - directionSign(direction) * config_.fallback_swing_pct * entry_price;
        LOG_DEBUG("{} no H4 swing beyond entry in {} bars, fallback level {:.5f}",
                  h4.symbol(), lookback, level);
    }
    return level;
}

HistoricalOutcomeStats RiskEstimator::historicalStats(const std::string& symbol, TradeDirection direction) {
    if (!outcome_store_) {
        return HistoricalOutcomeStats();
    }
    return HistoricalOutcomeStats::fromOutcomes(outcome_store_->queryClosedTrades(symbol, direction));
}

PositionSizing RiskEstimator::calculatePositionSize(
    double equity,
    double risk_fraction,
    double stop_distance,
    double point_value
) {
    if (!(stop_distance > 0.0)) {
        throw InvalidRiskPlan("stop distance must be positive, got " + std::to_string(stop_distance));
    }
    PositionSizing sizing;
    sizing.risk_amount = equity * risk_fraction;
    sizing.size = sizing.risk_amount / (stop_distance * point_value);
    if (!std::isfinite(sizing.size) || sizing.size <= 0.0) {
        throw InvalidRiskPlan("position size is not a positive finite number");
    }
    return sizing;
}

// ===== Open trade =====

std::optional<SlTpAdjustment> RiskEstimator::evaluateAdjustment(const OpenTradeAnalytics& analytics) {
    if (core::isTerminal(analytics.trade.state)) {
        return std::nullopt;
    }

    for (AdjustmentRule rule : config_.rule_order) {
        std::optional<SlTpAdjustment> adjustment;
        switch (rule) {
            case AdjustmentRule::BREAK_EVEN:
                adjustment = checkBreakEven(analytics);
                break;
            case AdjustmentRule::TRAIL:
                adjustment = checkTrail(analytics);
                break;
            case AdjustmentRule::TIME_EXIT:
                adjustment = checkTimeExit(analytics);
                break;
            case AdjustmentRule::EXHAUSTION_EXIT:
                adjustment = checkExhaustion(analytics);
                break;
        }
        if (adjustment) {
            LOG_INFO("{} trade {} adjustment [{}]: {}",
                     analytics.trade.symbol, analytics.trade.id, toString(rule), adjustment->reason);
            return adjustment;
        }
    }
    return std::nullopt;
}

std::optional<SlTpAdjustment> RiskEstimator::checkBreakEven(const OpenTradeAnalytics& analytics) const {
    const core::Trade& trade = analytics.trade;
    const double sign = directionSign(trade.direction);
    if (analytics.unrealized_r < config_.breakeven_r) {
        return std::nullopt;
    }
    // already at or beyond entry
    if ((trade.entry_price - trade.stop_loss) * sign <= 0.0) {
        return std::nullopt;
    }

    SlTpAdjustment adjustment;
    adjustment.kind = AdjustmentKind::MOVE_STOP;
    adjustment.rule = AdjustmentRule::BREAK_EVEN;
    adjustment.new_stop_loss = trade.entry_price;
    adjustment.reason = "break-even at " + std::to_string(analytics.unrealized_r) + "R";
    return adjustment;
}

std::optional<SlTpAdjustment> RiskEstimator::checkTrail(const OpenTradeAnalytics& analytics) const {
    const core::Trade& trade = analytics.trade;
    const double sign = directionSign(trade.direction);
    if (analytics.unrealized_r < config_.trail_r || analytics.atr_h4 <= 0.0) {
        return std::nullopt;
    }

    const double trail = analytics.current_price - sign * config_.trail_atr_fraction * analytics.atr_h4;
    const bool tightens = (trail - trade.stop_loss) * sign > 0.0;
    const bool below_price = (analytics.current_price - trail) * sign > 0.0;
    if (!tightens || !below_price) {
        return std::nullopt;
    }

    SlTpAdjustment adjustment;
    adjustment.kind = AdjustmentKind::MOVE_STOP;
    adjustment.rule = AdjustmentRule::TRAIL;
    adjustment.new_stop_loss = trail;
    adjustment.reason = "trailing stop at " + std::to_string(analytics.unrealized_r) + "R";
    return adjustment;
}

std::optional<SlTpAdjustment> RiskEstimator::checkTimeExit(const OpenTradeAnalytics& analytics) {
    if (analytics.has_new_favorable_structure) {
        return std::nullopt;
    }
    const HistoricalOutcomeStats stats = historicalStats(analytics.trade.symbol, analytics.trade.direction);
    if (stats.sample_count < config_.min_history_samples || stats.median_winner_holding <= 0) {
        return std::nullopt;
    }

    const double limit = static_cast<double>(stats.median_winner_holding) * config_.time_exit_factor;
    if (static_cast<double>(analytics.elapsed) <= limit) {
        return std::nullopt;
    }

    SlTpAdjustment adjustment;
    adjustment.kind = AdjustmentKind::CLOSE_EARLY;
    adjustment.rule = AdjustmentRule::TIME_EXIT;
    adjustment.reason = "held " + std::to_string(analytics.elapsed / 60000) +
                        " min, median winner " + std::to_string(stats.median_winner_holding / 60000) + " min";
    return adjustment;
}

std::optional<SlTpAdjustment> RiskEstimator::checkExhaustion(const OpenTradeAnalytics& analytics) const {
    if (!analytics.trend_exhausted) {
        return std::nullopt;
    }
    SlTpAdjustment adjustment;
    adjustment.kind = AdjustmentKind::CLOSE_EARLY;
    adjustment.rule = AdjustmentRule::EXHAUSTION_EXIT;
    adjustment.reason = "adverse change of character since open";
    return adjustment;
}

} // namespace risk
} // namespace fvgscan
