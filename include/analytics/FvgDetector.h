#pragma once

#include <vector>
#include "common/CandleSeries.h"
#include "common/Types.h"

namespace fvgscan {
namespace analytics {

struct FairValueGap {
    MarketBias direction = MarketBias::BULLISH;
    double high = 0.0;
    double low = 0.0;
    size_t origin_index = 0;        // middle bar of the three-bar pattern
    Timestamp origin_timestamp = 0;
    bool filled = false;            // kept for audit, excluded from bias
    size_t filled_index = 0;
};

struct FvgConfig {
    int lookback = 50;              // bars scanned for new gaps (0 = whole series)
};

class IFvgDetector {
public:
    virtual ~IFvgDetector() = default;
    virtual std::vector<FairValueGap> detect(const CandleSeries& series) const = 0;
};

// Three-bar imbalance: bullish when a.high < c.low, bearish when a.low > c.high
class FvgDetector : public IFvgDetector {
public:
    explicit FvgDetector(FvgConfig config = FvgConfig());

    std::vector<FairValueGap> detect(const CandleSeries& series) const override;

private:
    FvgConfig config_;
};

} // namespace analytics
} // namespace fvgscan
