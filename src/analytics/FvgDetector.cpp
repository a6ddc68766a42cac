#include "analytics/FvgDetector.h"
#include "common/Logger.h"

namespace fvgscan {
namespace analytics {

FvgDetector::FvgDetector(FvgConfig config)
    : config_(config) {}

std::vector<FairValueGap> FvgDetector::detect(const CandleSeries& series) const {
    std::vector<FairValueGap> gaps;
    const auto& candles = series.candles();
    if (candles.size() < 3) {
        return gaps;
    }

    size_t start = 0;
    if (config_.lookback > 0 && candles.size() > static_cast<size_t>(config_.lookback)) {
        start = candles.size() - static_cast<size_t>(config_.lookback);
    }

    for (size_t c = start + 2; c < candles.size(); ++c) {
        const Candle& a = candles[c - 2];
        const Candle& b = candles[c - 1];
        const Candle& next = candles[c];

        FairValueGap gap;
        if (a.high < next.low) {
            gap.direction = MarketBias::BULLISH;
            gap.low = a.high;
            gap.high = next.low;
        } else if (a.low > next.high) {
            gap.direction = MarketBias::BEARISH;
            gap.low = next.high;
            gap.high = a.low;
        } else {
            continue;
        }

        // Zero-width or inverted zone
        if (!(gap.high > gap.low)) {
            continue;
        }

        gap.origin_index = c - 1;
        gap.origin_timestamp = b.timestamp;

        for (size_t j = c + 1; j < candles.size(); ++j) {
            if (candles[j].low <= gap.low && candles[j].high >= gap.high) {
                gap.filled = true;
                gap.filled_index = j;
                break;
            }
        }

        gaps.push_back(gap);
    }

    LOG_DEBUG("{} {}: detected {} FVGs in {} candles",
              series.symbol(), toString(series.timeframe()), gaps.size(), candles.size() - start);
    return gaps;
}

} // namespace analytics
} // namespace fvgscan
