#include "strategy/H4ZoneStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace fvgscan {
namespace strategy {

namespace {
const std::vector<Timeframe> kSignalTimeframes = {
    Timeframe::H4, Timeframe::H1, Timeframe::M30, Timeframe::M15, Timeframe::M5, Timeframe::M1
};
const std::vector<Timeframe> kStructureTimeframes = {Timeframe::H1, Timeframe::M30, Timeframe::M15};
const std::vector<Timeframe> kEntryTimeframes = {Timeframe::M5, Timeframe::M1};

size_t windowStart(size_t size, int lookback) {
    const size_t window = static_cast<size_t>(std::max(lookback, 0));
    return (size > window) ? size - window : 0;
}

std::string timeframeLabel(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return "M1";
        case Timeframe::M5: return "M5";
        case Timeframe::M15: return "M15";
        case Timeframe::M30: return "M30";
        case Timeframe::H1: return "H1";
        case Timeframe::H4: return "H4";
    }
    return "M1";
}

bool isBreak(const analytics::StructureEvent& event) {
    return event.kind == analytics::StructureEventKind::BOS ||
           event.kind == analytics::StructureEventKind::CHOCH;
}
} // namespace

std::string toString(TradeOutlook outlook) {
    switch (outlook) {
        case TradeOutlook::CONTINUATION: return "continuation";
        case TradeOutlook::EXHAUSTION: return "exhaustion";
        case TradeOutlook::NEUTRAL: return "neutral";
    }
    return "neutral";
}

H4ZoneStrategy::H4ZoneStrategy(
    H4ZoneStrategyConfig config,
    std::shared_ptr<const analytics::IStructureAnalyzer> structure_analyzer,
    std::shared_ptr<const analytics::IFvgDetector> fvg_detector,
    std::shared_ptr<const analytics::IOrderBlockDetector> order_block_detector,
    std::shared_ptr<risk::IRiskEstimator> risk_estimator
)
    : config_(std::move(config))
    , structure_analyzer_(std::move(structure_analyzer))
    , fvg_detector_(std::move(fvg_detector))
    , order_block_detector_(std::move(order_block_detector))
    , risk_estimator_(std::move(risk_estimator))
{
    if (!structure_analyzer_ || !fvg_detector_ || !order_block_detector_ || !risk_estimator_) {
        throw InvariantViolation("H4ZoneStrategy requires analyzers and a risk estimator");
    }
}

StrategyInfo H4ZoneStrategy::getInfo() const {
    StrategyInfo info;
    info.name = config_.name;
    info.description = "H4 FVG/order-block bias, lower timeframe structure and M5/M1 entry trigger";
    info.timeframe = "4h";
    return info;
}

// ===== New signal =====

std::optional<core::Signal> H4ZoneStrategy::evaluateNewSignal(const MultiTimeframeContext& ctx) const {
    std::optional<std::map<Timeframe, CandleSeries>> closed;
    try {
        closed = closedSeries(ctx, kSignalTimeframes);
    } catch (const DataInsufficient& e) {
        LOG_WARN("{} insufficient data: {}", ctx.symbol, e.what());
        return std::nullopt;
    }

    // 1) new H4 close
    const CandleSeries& h4 = closed->at(Timeframe::H4);
    const Timestamp h4_bar_time = h4.lastTimestamp();
    if (ctx.last_seen_h4 && h4_bar_time <= *ctx.last_seen_h4) {
        LOG_DEBUG("{} no new H4 close since {}", ctx.symbol, *ctx.last_seen_h4);
        return std::nullopt;
    }
    LOG_INFO("{} new H4 close at {}, evaluating", ctx.symbol, h4.closeTimeOf(h4.size() - 1));

    // 2) H4 bias
    const auto zone = determineBias(h4);
    if (!zone) {
        LOG_INFO("{} no H4 bias", ctx.symbol);
        return std::nullopt;
    }

    // 3) structure confirmation
    const auto confirmations = findStructureConfirmations(*closed, zone->bias);
    if (confirmations.empty()) {
        LOG_INFO("{} {} bias without H1/M30/M15 structure confirmation", ctx.symbol, toString(zone->bias));
        return std::nullopt;
    }

    // 4) entry trigger
    std::optional<std::string> trigger;
    for (Timeframe tf : kEntryTimeframes) {
        trigger = findEntryTrigger(closed->at(tf), *zone);
        if (trigger) {
            break;
        }
    }
    if (!trigger) {
        LOG_INFO("{} {} bias confirmed, waiting for M5/M1 entry trigger", ctx.symbol, toString(zone->bias));
        return std::nullopt;
    }

    // 5) build and price
    core::Signal signal;
    signal.symbol = ctx.symbol;
    signal.direction = directionFromBias(zone->bias);
    signal.time = ctx.now;
    signal.h4_bar_time = h4_bar_time;
    signal.entry_price = ctx.current_price;
    signal.strategy_name = config_.name;
    signal.id = ctx.symbol + ":" + std::to_string(h4_bar_time) + ":" + toString(signal.direction);

    std::ostringstream notes;
    notes << "H4 " << zone->source << " " << toString(zone->bias)
          << " zone [" << zone->low << ", " << zone->high << "]; structure:";
    for (const auto& confirmation : confirmations) {
        notes << " " << confirmation;
    }
    notes << "; entry: " << *trigger;
    signal.notes = notes.str();

    risk::SignalContext risk_ctx;
    risk_ctx.symbol = ctx.symbol;
    risk_ctx.direction = signal.direction;
    risk_ctx.entry_price = signal.entry_price;
    risk_ctx.h4 = h4;
    risk_ctx.h1 = closed->at(Timeframe::H1);

    try {
        signal.risk_plan = risk_estimator_->estimateForNewSignal(risk_ctx);
    } catch (const InvalidRiskPlan& e) {
        LOG_ERROR("{} signal dropped, invalid risk plan: {}", ctx.symbol, e.what());
        return std::nullopt;
    } catch (const InvariantViolation& e) {
        LOG_ERROR("{} signal dropped, invalid levels: {}", ctx.symbol, e.what());
        return std::nullopt;
    }
    signal.estimated_rr = signal.risk_plan.reward_risk;

    LOG_INFO("{} signal {} {} @ {:.5f}: {}",
             ctx.symbol, signal.id, toString(signal.direction), signal.entry_price, signal.notes);
    return signal;
}

std::optional<BiasZone> H4ZoneStrategy::determineBias(const CandleSeries& h4) const {
    const size_t min_index = windowStart(h4.size(), config_.h4_zone_lookback);

    std::optional<BiasZone> latest_fvg;
    for (const auto& gap : fvg_detector_->detect(h4)) {
        if (gap.filled || gap.origin_index < min_index) {
            continue;
        }
        if (!latest_fvg || gap.origin_index >= latest_fvg->origin_index) {
            latest_fvg = BiasZone{gap.direction, gap.high, gap.low, "FVG", gap.origin_index, gap.origin_timestamp};
        }
    }

    std::optional<BiasZone> latest_ob;
    for (const auto& block : order_block_detector_->detect(h4)) {
        if (block.origin_index < min_index) {
            continue;
        }
        if (!latest_ob || block.origin_index >= latest_ob->origin_index) {
            latest_ob = BiasZone{block.direction, block.high, block.low, "OB", block.origin_index, block.origin_timestamp};
        }
    }

    if (latest_fvg && latest_ob) {
        if (latest_fvg->bias != latest_ob->bias) {
            LOG_INFO("{} H4 zones conflict: FVG {} vs OB {}",
                     h4.symbol(), toString(latest_fvg->bias), toString(latest_ob->bias));
            return std::nullopt;
        }
        return (latest_ob->origin_index > latest_fvg->origin_index) ? latest_ob : latest_fvg;
    }
    return latest_fvg ? latest_fvg : latest_ob;
}

std::vector<std::string> H4ZoneStrategy::findStructureConfirmations(
    const std::map<Timeframe, CandleSeries>& closed,
    MarketBias bias
) const {
    std::vector<std::string> confirmations;
    for (Timeframe tf : kStructureTimeframes) {
        auto it = closed.find(tf);
        if (it == closed.end()) {
            continue;
        }
        const CandleSeries& series = it->second;
        const size_t min_index = windowStart(series.size(), config_.structure_lookback);
        const auto analysis = structure_analyzer_->analyze(series);

        for (auto event = analysis.events.rbegin(); event != analysis.events.rend(); ++event) {
            if (event->index < min_index) {
                break;
            }
            if (isBreak(*event) && event->direction == bias) {
                confirmations.push_back(timeframeLabel(tf) + " " + analytics::toString(event->kind));
                break;
            }
        }
    }
    return confirmations;
}

std::optional<std::string> H4ZoneStrategy::findEntryTrigger(
    const CandleSeries& series,
    const BiasZone& zone
) const {
    const std::string label = timeframeLabel(series.timeframe());

    const size_t wick_start = windowStart(series.size(), config_.entry_lookback);
    for (size_t i = series.size(); i > wick_start; --i) {
        if (isWickRejection(series[i - 1], zone)) {
            return label + " wick rejection";
        }
    }

    const size_t micro_start = windowStart(series.size(), config_.micro_structure_lookback);
    const auto analysis = structure_analyzer_->analyze(series);
    for (auto event = analysis.events.rbegin(); event != analysis.events.rend(); ++event) {
        if (event->index < micro_start) {
            break;
        }
        if (isBreak(*event) && event->direction == zone.bias) {
            return label + " micro " + analytics::toString(event->kind);
        }
    }
    return std::nullopt;
}

bool H4ZoneStrategy::isWickRejection(const Candle& bar, const BiasZone& zone) const {
    const double body = std::abs(bar.close - bar.open);
    if (zone.bias == MarketBias::BULLISH) {
        const double lower_wick = std::min(bar.open, bar.close) - bar.low;
        return bar.low <= zone.high &&
               bar.close > zone.high &&
               bar.close > bar.open &&
               lower_wick > 0.0 &&
               lower_wick >= config_.wick_body_ratio * body;
    }
    const double upper_wick = bar.high - std::max(bar.open, bar.close);
    return bar.high >= zone.low &&
           bar.close < zone.low &&
           bar.close < bar.open &&
           upper_wick > 0.0 &&
           upper_wick >= config_.wick_body_ratio * body;
}

std::map<Timeframe, CandleSeries> H4ZoneStrategy::closedSeries(
    const MultiTimeframeContext& ctx,
    const std::vector<Timeframe>& timeframes
) const {
    std::map<Timeframe, CandleSeries> closed;
    for (Timeframe tf : timeframes) {
        const CandleSeries* series = ctx.find(tf);
        if (!series) {
            throw DataInsufficient(toString(tf) + " series missing");
        }
        CandleSeries slice = series->closedAt(ctx.now);
        if (slice.size() < structure_analyzer_->minimumBars()) {
            throw DataInsufficient(toString(tf) + " has " + std::to_string(slice.size()) +
                                   " closed bars, need " + std::to_string(structure_analyzer_->minimumBars()));
        }
        closed.emplace(tf, std::move(slice));
    }
    if (!std::isfinite(ctx.current_price) || ctx.current_price <= 0.0) {
        throw DataInsufficient("no current price");
    }
    return closed;
}

// ===== Open trade =====

std::optional<AdjustmentRecommendation> H4ZoneStrategy::evaluateOpenTrade(
    const core::Trade& trade,
    const MultiTimeframeContext& ctx
) const {
    if (core::isTerminal(trade.state)) {
        return std::nullopt;
    }
    std::optional<std::map<Timeframe, CandleSeries>> closed;
    try {
        closed = closedSeries(ctx, {Timeframe::H4, Timeframe::H1});
    } catch (const DataInsufficient& e) {
        LOG_WARN("{} insufficient data for trade {}: {}", ctx.symbol, trade.id, e.what());
        return std::nullopt;
    }

    const MarketBias trade_bias = biasFromDirection(trade.direction);
    const CandleSeries& h4 = closed->at(Timeframe::H4);
    const CandleSeries& h1 = closed->at(Timeframe::H1);

    // newest structural break after the open decides the outlook
    Timestamp favorable_at = 0;
    Timestamp adverse_at = 0;
    std::string latest_label;
    for (const CandleSeries* series : {&h4, &h1}) {
        const auto analysis = structure_analyzer_->analyze(*series);
        for (const auto& event : analysis.events) {
            if (!isBreak(event) || event.timestamp < trade.open_time) {
                continue;
            }
            if (event.direction == trade_bias) {
                favorable_at = std::max(favorable_at, event.timestamp);
            } else if (event.kind == analytics::StructureEventKind::CHOCH) {
                adverse_at = std::max(adverse_at, event.timestamp);
            }
        }
    }

    AdjustmentRecommendation recommendation;
    if (adverse_at > 0 && adverse_at >= favorable_at) {
        recommendation.outlook = TradeOutlook::EXHAUSTION;
        recommendation.rationale = "adverse CHOCH after open";
    } else if (favorable_at > 0) {
        recommendation.outlook = TradeOutlook::CONTINUATION;
        recommendation.rationale = "favorable structure break after open";
    } else {
        recommendation.outlook = TradeOutlook::NEUTRAL;
        recommendation.rationale = "no structure break since open";
    }

    double atr = analytics::TechnicalIndicators::calculateATR(h4.candles(), config_.atr_period);
    if (atr <= 0.0) {
        atr = analytics::TechnicalIndicators::calculateATR(h1.candles(), config_.atr_period);
    }

    risk::OpenTradeAnalytics& trade_analytics = recommendation.analytics;
    trade_analytics.trade = trade;
    trade_analytics.current_price = ctx.current_price;
    trade_analytics.atr_h4 = atr;
    trade_analytics.elapsed = ctx.now - trade.open_time;
    trade_analytics.unrealized_r = trade.rMultipleAt(ctx.current_price);
    trade_analytics.has_new_favorable_structure = favorable_at > 0;
    trade_analytics.trend_exhausted = recommendation.outlook == TradeOutlook::EXHAUSTION;

    LOG_DEBUG("{} trade {} outlook {} at {:.2f}R",
              ctx.symbol, trade.id, toString(recommendation.outlook), trade_analytics.unrealized_r);
    return recommendation;
}

} // namespace strategy
} // namespace fvgscan
