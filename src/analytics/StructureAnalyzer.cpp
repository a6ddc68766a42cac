#include "analytics/StructureAnalyzer.h"
#include "common/Errors.h"

#include <algorithm>

namespace fvgscan {
namespace analytics {

namespace {
struct ActiveLevel {
    double price = 0.0;
    size_t index = 0;
    bool swept = false;
};

std::optional<MarketBias> lastBreakDirection(const std::vector<StructureEvent>& events) {
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        if (it->kind != StructureEventKind::SWEEP) {
            return it->direction;
        }
    }
    return std::nullopt;
}
}

std::string toString(StructureEventKind kind) {
    switch (kind) {
        case StructureEventKind::BOS: return "BOS";
        case StructureEventKind::CHOCH: return "CHOCH";
        case StructureEventKind::SWEEP: return "sweep";
    }
    return "BOS";
}

StructureAnalysis IStructureAnalyzer::analyze(const CandleSeries& series) const {
    StructureAnalysis analysis;
    analysis.swings = findSwings(series);
    analysis.events = findStructure(series, analysis.swings);
    analysis.trend = lastBreakDirection(analysis.events);
    return analysis;
}

StructureAnalyzer::StructureAnalyzer(StructureConfig config)
    : config_(config) {
    if (config_.swing_window <= 0) {
        throw InvariantViolation("swing_window must be positive");
    }
}

size_t StructureAnalyzer::minimumBars() const {
    return static_cast<size_t>(config_.swing_window) * 2 + 1;
}

std::vector<SwingPoint> StructureAnalyzer::findSwings(const CandleSeries& series) const {
    std::vector<SwingPoint> swings;
    const auto& candles = series.candles();
    const size_t window = static_cast<size_t>(config_.swing_window);
    if (candles.size() < minimumBars()) {
        return swings;
    }

    for (size_t i = window; i + window < candles.size(); ++i) {
        bool is_high = true;
        bool is_low = true;
        for (size_t j = i - window; j <= i + window; ++j) {
            if (j == i) continue;
            if (candles[j].high >= candles[i].high) is_high = false;
            if (candles[j].low <= candles[i].low) is_low = false;
            if (!is_high && !is_low) break;
        }

        if (is_high) {
            swings.push_back({i, candles[i].timestamp, candles[i].high, SwingKind::HIGH});
        }
        if (is_low) {
            swings.push_back({i, candles[i].timestamp, candles[i].low, SwingKind::LOW});
        }
    }
    return swings;
}

std::vector<StructureEvent> StructureAnalyzer::findStructure(
    const CandleSeries& series,
    const std::vector<SwingPoint>& swings
) const {
    std::vector<StructureEvent> events;
    const auto& candles = series.candles();
    if (candles.size() < minimumBars() || swings.empty()) {
        return events;
    }

    std::vector<SwingPoint> ordered = swings;
    std::stable_sort(ordered.begin(), ordered.end(), [](const SwingPoint& a, const SwingPoint& b) {
        return a.index < b.index;
    });

    const size_t window = static_cast<size_t>(config_.swing_window);
    std::optional<ActiveLevel> active_high;
    std::optional<ActiveLevel> active_low;
    std::optional<MarketBias> trend;
    size_t next_swing = 0;

    for (size_t k = 0; k < candles.size(); ++k) {
        while (next_swing < ordered.size() && ordered[next_swing].index + window <= k) {
            const auto& swing = ordered[next_swing];
            ActiveLevel level;
            level.price = swing.price;
            level.index = swing.index;
            if (swing.kind == SwingKind::HIGH) {
                active_high = level;
            } else {
                active_low = level;
            }
            ++next_swing;
        }

        const Candle& bar = candles[k];

        if (active_high) {
            if (bar.close > active_high->price) {
                StructureEvent event;
                event.kind = (trend == MarketBias::BEARISH) ? StructureEventKind::CHOCH : StructureEventKind::BOS;
                event.direction = MarketBias::BULLISH;
                event.price = active_high->price;
                event.index = k;
                event.timestamp = bar.timestamp;
                events.push_back(event);
                trend = MarketBias::BULLISH;
                active_high.reset();
            } else if (bar.high > active_high->price && !active_high->swept) {
                StructureEvent event;
                event.kind = StructureEventKind::SWEEP;
                event.direction = MarketBias::BEARISH;
                event.price = active_high->price;
                event.index = k;
                event.timestamp = bar.timestamp;
                events.push_back(event);
                active_high->swept = true;
            }
        }

        if (active_low) {
            if (bar.close < active_low->price) {
                StructureEvent event;
                event.kind = (trend == MarketBias::BULLISH) ? StructureEventKind::CHOCH : StructureEventKind::BOS;
                event.direction = MarketBias::BEARISH;
                event.price = active_low->price;
                event.index = k;
                event.timestamp = bar.timestamp;
                events.push_back(event);
                trend = MarketBias::BEARISH;
                active_low.reset();
            } else if (bar.low < active_low->price && !active_low->swept) {
                StructureEvent event;
                event.kind = StructureEventKind::SWEEP;
                event.direction = MarketBias::BULLISH;
                event.price = active_low->price;
                event.index = k;
                event.timestamp = bar.timestamp;
                events.push_back(event);
                active_low->swept = true;
            }
        }
    }

    return events;
}

} // namespace analytics
} // namespace fvgscan
