#include "common/Errors.h"
#include "strategy/H4ZoneStrategy.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>

using namespace fvgscan;
using namespace fvgscan::strategy;
using namespace fvgscan::testsupport;

namespace {

const DurationMs kH4 = 4 * 60 * kMinuteMs;
const Timestamp kNow = kBaseTime + 30 * kH4;

class ScriptedStructureAnalyzer : public analytics::IStructureAnalyzer {
public:
    std::map<Timeframe, std::vector<analytics::StructureEvent>> events;

    std::vector<analytics::SwingPoint> findSwings(const CandleSeries&) const override {
        return {};
    }
    std::vector<analytics::StructureEvent> findStructure(
        const CandleSeries& series,
        const std::vector<analytics::SwingPoint>&
    ) const override {
        auto it = events.find(series.timeframe());
        return (it != events.end()) ? it->second : std::vector<analytics::StructureEvent>();
    }
    size_t minimumBars() const override { return 5; }
};

class ScriptedFvgDetector : public analytics::IFvgDetector {
public:
    std::vector<analytics::FairValueGap> gaps;
    std::vector<analytics::FairValueGap> detect(const CandleSeries&) const override { return gaps; }
};

class ScriptedOrderBlockDetector : public analytics::IOrderBlockDetector {
public:
    std::vector<analytics::OrderBlock> blocks;
    std::vector<analytics::OrderBlock> detect(const CandleSeries&) const override { return blocks; }
};

class ScriptedRiskEstimator : public risk::IRiskEstimator {
public:
    bool fail = false;
    risk::SignalContext last_context;

    core::RiskPlan estimateForNewSignal(const risk::SignalContext& ctx) override {
        last_context = ctx;
        if (fail) {
            throw InvalidRiskPlan("no volatility");
        }
        core::RiskPlan plan;
        plan.stop_loss = 100.0;
        plan.take_profit = 116.0;
        plan.stop_distance = 6.5;
        plan.reward_risk = 9.5 / 6.5;
        return plan;
    }
    std::optional<risk::SlTpAdjustment> evaluateAdjustment(const risk::OpenTradeAnalytics&) override {
        return std::nullopt;
    }
};

analytics::StructureEvent breakEvent(analytics::StructureEventKind kind, MarketBias direction,
                                     size_t index, Timestamp timestamp) {
    analytics::StructureEvent event;
    event.kind = kind;
    event.direction = direction;
    event.index = index;
    event.timestamp = timestamp;
    event.price = 105.0;
    return event;
}

analytics::FairValueGap bullishGap(size_t origin_index) {
    analytics::FairValueGap gap;
    gap.direction = MarketBias::BULLISH;
    gap.low = 100.0;
    gap.high = 105.0;
    gap.origin_index = origin_index;
    gap.origin_timestamp = kBaseTime + static_cast<Timestamp>(origin_index) * kH4;
    return gap;
}

MultiTimeframeContext bullishContext() {
    MultiTimeframeContext ctx;
    ctx.symbol = "US30";
    ctx.now = kNow;
    ctx.current_price = 106.5;
    for (Timeframe tf : kAllTimeframes) {
        ctx.series[tf] = flatSeries("US30", tf, 30, kNow, 106.0);
    }
    // M5 rejection of the zone top: low 104 inside, close 106.5 above, wick 2 vs body 0.5
    std::vector<Candle> m5 = ctx.series[Timeframe::M5].candles();
    m5.back() = bar(m5.back().timestamp, 106.0, 107.0, 104.0, 106.5);
    ctx.series[Timeframe::M5] = CandleSeries("US30", Timeframe::M5, m5);
    return ctx;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting H4ZoneStrategy Test..." << std::endl;

    auto structure = std::make_shared<ScriptedStructureAnalyzer>();
    auto fvg = std::make_shared<ScriptedFvgDetector>();
    auto order_blocks = std::make_shared<ScriptedOrderBlockDetector>();
    auto estimator = std::make_shared<ScriptedRiskEstimator>();
    H4ZoneStrategy strategy(H4ZoneStrategyConfig(), structure, fvg, order_blocks, estimator);

    fvg->gaps = {bullishGap(25)};
    structure->events[Timeframe::H1] = {
        breakEvent(analytics::StructureEventKind::BOS, MarketBias::BULLISH, 25, kNow - 5 * 60 * kMinuteMs)
    };

    const Timestamp last_h4 = kNow - kH4;

    // 1. Full chain -> one priced signal
    {
        const auto signal = strategy.evaluateNewSignal(bullishContext());
        assert(signal);
        assert(signal->direction == TradeDirection::BUY);
        assert(signal->h4_bar_time == last_h4);
        assert(signal->id == "US30:" + std::to_string(last_h4) + ":buy");
        assert(signal->entry_price == 106.5);
        assert(signal->time == kNow);
        assert(signal->risk_plan.stop_loss == 100.0);
        assert(near(signal->estimated_rr, 9.5 / 6.5));
        assert(signal->notes.find("H4 FVG bullish zone") != std::string::npos);
        assert(signal->notes.find("H1 BOS") != std::string::npos);
        assert(signal->notes.find("M5 wick rejection") != std::string::npos);
        assert(estimator->last_context.h4.size() == 30);
        assert(estimator->last_context.h1.timeframe() == Timeframe::H1);
    }

    // 2. The same H4 close is evaluated once
    {
        MultiTimeframeContext ctx = bullishContext();
        ctx.last_seen_h4 = last_h4;
        assert(!strategy.evaluateNewSignal(ctx));
        ctx.last_seen_h4 = last_h4 - kH4;
        assert(strategy.evaluateNewSignal(ctx));
    }

    // 3. A forming H4 bar is not part of the decision
    {
        MultiTimeframeContext ctx = bullishContext();
        std::vector<Candle> h4 = ctx.series[Timeframe::H4].candles();
        h4.push_back(bar(kNow, 106, 107, 105, 106.5));
        ctx.series[Timeframe::H4] = CandleSeries("US30", Timeframe::H4, h4);
        const auto signal = strategy.evaluateNewSignal(ctx);
        assert(signal && signal->h4_bar_time == last_h4);
        assert(estimator->last_context.h4.size() == 30);
    }

    // 4. Zone selection: newer agreeing OB wins, disagreeing zones cancel, filled gaps ignored
    {
        analytics::OrderBlock block;
        block.direction = MarketBias::BULLISH;
        block.low = 101.0;
        block.high = 104.0;
        block.origin_index = 27;
        order_blocks->blocks = {block};
        auto zone = strategy.determineBias(bullishContext().series[Timeframe::H4]);
        assert(zone && zone->source == "OB" && zone->origin_index == 27);

        order_blocks->blocks[0].direction = MarketBias::BEARISH;
        assert(!strategy.determineBias(bullishContext().series[Timeframe::H4]));
        assert(!strategy.evaluateNewSignal(bullishContext()));
        order_blocks->blocks.clear();

        fvg->gaps[0].filled = true;
        assert(!strategy.determineBias(bullishContext().series[Timeframe::H4]));
        fvg->gaps[0].filled = false;

        // older than the zone lookback
        fvg->gaps = {bullishGap(5)};
        assert(!strategy.determineBias(bullishContext().series[Timeframe::H4]));
        fvg->gaps = {bullishGap(25)};
    }

    // 5. No confirming structure, or structure against the bias
    {
        structure->events[Timeframe::H1][0].direction = MarketBias::BEARISH;
        assert(!strategy.evaluateNewSignal(bullishContext()));
        structure->events[Timeframe::H1].clear();
        structure->events[Timeframe::M15] = {
            breakEvent(analytics::StructureEventKind::CHOCH, MarketBias::BULLISH, 28, kNow - 30 * kMinuteMs)
        };
        const auto signal = strategy.evaluateNewSignal(bullishContext());
        assert(signal && signal->notes.find("M15 CHOCH") != std::string::npos);
        structure->events.erase(Timeframe::M15);
        structure->events[Timeframe::H1] = {
            breakEvent(analytics::StructureEventKind::BOS, MarketBias::BULLISH, 25, kNow - 5 * 60 * kMinuteMs)
        };
    }

    // 6. No trigger on M5/M1; micro BOS on M1 triggers
    {
        MultiTimeframeContext ctx = bullishContext();
        ctx.series[Timeframe::M5] = flatSeries("US30", Timeframe::M5, 30, kNow, 106.0);
        assert(!strategy.evaluateNewSignal(ctx));

        structure->events[Timeframe::M1] = {
            breakEvent(analytics::StructureEventKind::BOS, MarketBias::BULLISH, 27, kNow - 3 * kMinuteMs)
        };
        const auto signal = strategy.evaluateNewSignal(ctx);
        assert(signal && signal->notes.find("M1 micro BOS") != std::string::npos);
        structure->events.erase(Timeframe::M1);
    }

    // 7. Missing or short data, and a failed risk plan, yield nothing
    {
        MultiTimeframeContext ctx = bullishContext();
        ctx.series.erase(Timeframe::M30);
        assert(!strategy.evaluateNewSignal(ctx));

        ctx = bullishContext();
        ctx.series[Timeframe::M1] = flatSeries("US30", Timeframe::M1, 3, kNow, 106.0);
        assert(!strategy.evaluateNewSignal(ctx));

        estimator->fail = true;
        assert(!strategy.evaluateNewSignal(bullishContext()));
        estimator->fail = false;
    }

    // 8. Open trade outlook
    {
        core::Trade trade;
        trade.id = "T000001";
        trade.symbol = "US30";
        trade.direction = TradeDirection::BUY;
        trade.entry_price = 100.0;
        trade.initial_stop_loss = 95.0;
        trade.stop_loss = 95.0;
        trade.take_profit = 120.0;
        trade.open_time = kNow - 10 * 60 * kMinuteMs;

        MultiTimeframeContext ctx = bullishContext();
        ctx.current_price = 110.0;

        auto recommendation = strategy.evaluateOpenTrade(trade, ctx);
        assert(recommendation);
        assert(recommendation->outlook == TradeOutlook::CONTINUATION);
        assert(recommendation->analytics.has_new_favorable_structure);
        assert(near(recommendation->analytics.unrealized_r, 2.0));
        assert(recommendation->analytics.elapsed == 10 * 60 * kMinuteMs);
        assert(near(recommendation->analytics.atr_h4, 1.0));

        structure->events[Timeframe::H1].push_back(
            breakEvent(analytics::StructureEventKind::CHOCH, MarketBias::BEARISH, 28, kNow - 2 * 60 * kMinuteMs));
        recommendation = strategy.evaluateOpenTrade(trade, ctx);
        assert(recommendation && recommendation->outlook == TradeOutlook::EXHAUSTION);
        assert(recommendation->analytics.trend_exhausted);

        // breaks before the open do not count
        trade.open_time = kNow - 60 * kMinuteMs;
        recommendation = strategy.evaluateOpenTrade(trade, ctx);
        assert(recommendation && recommendation->outlook == TradeOutlook::NEUTRAL);
        assert(!recommendation->analytics.has_new_favorable_structure);

        trade.state = core::TradeState::CLOSED_BY_TP;
        assert(!strategy.evaluateOpenTrade(trade, ctx));
    }

    assert(strategy.getInfo().timeframe == "4h");

    std::cout << "[TEST] H4ZoneStrategy Test PASSED!" << std::endl;
    return 0;
}
