#include "analytics/StructureAnalyzer.h"
#include "common/Errors.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>

using namespace fvgscan;
using namespace fvgscan::analytics;
using namespace fvgscan::testsupport;

namespace {
CandleSeries h1Series(const std::vector<std::vector<double>>& ohlc) {
    const DurationMs h1 = timeframeDuration(Timeframe::H1);
    std::vector<Candle> candles;
    for (size_t i = 0; i < ohlc.size(); ++i) {
        candles.push_back(bar(kBaseTime + static_cast<Timestamp>(i) * h1,
                              ohlc[i][0], ohlc[i][1], ohlc[i][2], ohlc[i][3]));
    }
    return CandleSeries("US30", Timeframe::H1, std::move(candles));
}

// swing high 15 at index 2; bar 6 closes above it
const std::vector<std::vector<double>> kBreakout = {
    {9, 10, 8, 9},
    {9, 11, 8.5, 10},
    {10, 15, 9, 14},
    {11, 12, 10, 11.5},
    {11, 11, 9.5, 10},
    {10, 13, 9.8, 12.5},
    {12.5, 16, 12, 15.5}
};
}

int main() {
    std::cout << "[TEST] Starting StructureAnalyzer Test..." << std::endl;

    StructureConfig config;
    config.swing_window = 2;
    StructureAnalyzer analyzer(config);
    assert(analyzer.minimumBars() == 5);

    // 1. Too short
    assert(analyzer.findSwings(h1Series({{9, 10, 8, 9}, {9, 11, 8.5, 10}, {10, 15, 9, 14}})).empty());

    // 2. Swing + first break is a BOS
    {
        const auto analysis = analyzer.analyze(h1Series(kBreakout));
        assert(analysis.swings.size() == 1);
        assert(analysis.swings[0].index == 2);
        assert(analysis.swings[0].kind == SwingKind::HIGH);
        assert(analysis.swings[0].price == 15.0);

        assert(analysis.events.size() == 1);
        assert(analysis.events[0].kind == StructureEventKind::BOS);
        assert(analysis.events[0].direction == MarketBias::BULLISH);
        assert(analysis.events[0].index == 6);
        assert(analysis.events[0].price == 15.0);
        assert(analysis.trend && *analysis.trend == MarketBias::BULLISH);
    }

    // 3. Break against the established trend is a CHOCH
    {
        auto ohlc = kBreakout;
        ohlc.push_back({15.5, 15.8, 13, 13.5});
        ohlc.push_back({13.5, 14, 11, 11.5});     // swing low 11 at index 8
        ohlc.push_back({11.5, 13, 11.5, 12.5});
        ohlc.push_back({12.5, 14, 12, 13.5});
        ohlc.push_back({13.5, 13.8, 10, 10.5});   // closes below 11
        const auto analysis = analyzer.analyze(h1Series(ohlc));

        assert(analysis.events.size() == 2);
        assert(analysis.events[1].kind == StructureEventKind::CHOCH);
        assert(analysis.events[1].direction == MarketBias::BEARISH);
        assert(analysis.events[1].index == 11);
        assert(analysis.events[1].price == 11.0);
        assert(analysis.trend && *analysis.trend == MarketBias::BEARISH);
    }

    // 4. Wick through a swing high with the close back inside is a bearish sweep
    {
        auto ohlc = kBreakout;
        ohlc[6] = {12.5, 16, 12, 14};
        const auto analysis = analyzer.analyze(h1Series(ohlc));
        assert(analysis.events.size() == 1);
        assert(analysis.events[0].kind == StructureEventKind::SWEEP);
        assert(analysis.events[0].direction == MarketBias::BEARISH);
        assert(!analysis.trend);
    }

    // 5. Invalid window
    bool rejected = false;
    try {
        StructureConfig bad;
        bad.swing_window = 0;
        StructureAnalyzer invalid(bad);
    } catch (const InvariantViolation&) {
        rejected = true;
    }
    assert(rejected);

    std::cout << "[TEST] StructureAnalyzer Test PASSED!" << std::endl;
    return 0;
}
