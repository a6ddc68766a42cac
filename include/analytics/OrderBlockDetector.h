#pragma once

#include <vector>
#include "common/CandleSeries.h"
#include "common/Types.h"

namespace fvgscan {
namespace analytics {

struct OrderBlock {
    MarketBias direction = MarketBias::BULLISH;
    double high = 0.0;
    double low = 0.0;
    size_t origin_index = 0;
    Timestamp origin_timestamp = 0;
};

struct OrderBlockConfig {
    int atr_period = 14;
    int move_bars = 3;                  // length of the displacement after the block
    double strength_multiplier = 2.0;   // displacement must exceed this many ATRs
    int lookback = 50;                  // candidate window (0 = whole series)
};

class IOrderBlockDetector {
public:
    virtual ~IOrderBlockDetector() = default;
    virtual std::vector<OrderBlock> detect(const CandleSeries& series) const = 0;
};

// Last opposite candle before an ATR-scaled displacement. Blocks that price
// later closes through, or that a newer same-direction block overlaps, are
// pruned from the result.
class OrderBlockDetector : public IOrderBlockDetector {
public:
    explicit OrderBlockDetector(OrderBlockConfig config = OrderBlockConfig());

    std::vector<OrderBlock> detect(const CandleSeries& series) const override;

private:
    OrderBlockConfig config_;
};

} // namespace analytics
} // namespace fvgscan
