#include "analytics/OrderBlockDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>

namespace fvgscan {
namespace analytics {

namespace {
bool overlaps(const OrderBlock& a, const OrderBlock& b) {
    return a.low < b.high && b.low < a.high;
}

bool tradedThrough(const OrderBlock& block, const std::vector<Candle>& candles) {
    for (size_t j = block.origin_index + 1; j < candles.size(); ++j) {
        if (block.direction == MarketBias::BULLISH && candles[j].close < block.low) {
            return true;
        }
        if (block.direction == MarketBias::BEARISH && candles[j].close > block.high) {
            return true;
        }
    }
    return false;
}
}

OrderBlockDetector::OrderBlockDetector(OrderBlockConfig config)
    : config_(config) {
    if (config_.atr_period <= 0 || config_.move_bars <= 0 || config_.strength_multiplier <= 0.0) {
        throw InvariantViolation("order block config requires positive atr_period, move_bars and strength_multiplier");
    }
}

std::vector<OrderBlock> OrderBlockDetector::detect(const CandleSeries& series) const {
    std::vector<OrderBlock> blocks;
    const auto& candles = series.candles();
    const size_t period = static_cast<size_t>(config_.atr_period);
    const size_t move = static_cast<size_t>(config_.move_bars);

    if (candles.size() < period + move + 1) {
        return blocks;
    }

    const auto atr = TechnicalIndicators::calculateATRSeries(candles, config_.atr_period);

    size_t start = period;
    if (config_.lookback > 0 && candles.size() > static_cast<size_t>(config_.lookback) + move) {
        start = std::max(start, candles.size() - move - static_cast<size_t>(config_.lookback));
    }

    for (size_t i = start; i + move < candles.size(); ++i) {
        const Candle& block = candles[i];
        const Candle& first = candles[i + 1];
        if (!(block.high > block.low) || atr[i] <= 0.0) {
            continue;
        }

        const double displacement = candles[i + move].close - block.close;
        const double threshold = config_.strength_multiplier * atr[i];

        OrderBlock ob;
        if (block.close < block.open && first.close > first.open && displacement > threshold) {
            ob.direction = MarketBias::BULLISH;
        } else if (block.close > block.open && first.close < first.open && -displacement > threshold) {
            ob.direction = MarketBias::BEARISH;
        } else {
            continue;
        }

        ob.high = block.high;
        ob.low = block.low;
        ob.origin_index = i;
        ob.origin_timestamp = block.timestamp;
        blocks.push_back(ob);
    }

    blocks.erase(std::remove_if(blocks.begin(), blocks.end(), [&](const OrderBlock& ob) {
        return tradedThrough(ob, candles);
    }), blocks.end());

    std::vector<OrderBlock> pruned;
    for (size_t i = 0; i < blocks.size(); ++i) {
        bool superseded = false;
        for (size_t j = i + 1; j < blocks.size(); ++j) {
            if (blocks[j].direction == blocks[i].direction && overlaps(blocks[i], blocks[j])) {
                superseded = true;
                break;
            }
        }
        if (!superseded) {
            pruned.push_back(blocks[i]);
        }
    }

    LOG_DEBUG("{} {}: {} order blocks kept of {} candidates",
              series.symbol(), toString(series.timeframe()), pruned.size(), blocks.size());
    return pruned;
}

} // namespace analytics
} // namespace fvgscan
