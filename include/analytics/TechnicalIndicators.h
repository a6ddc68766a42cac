#pragma once

#include <vector>
#include "common/Types.h"

namespace fvgscan {
namespace analytics {

class TechnicalIndicators {
public:
    // True range per bar starting at index 1 (index 0 has no previous close)
    static std::vector<double> calculateTrueRanges(const std::vector<Candle>& candles);

    // ATR (Average True Range), Wilder's smoothing seeded by the simple mean
    // of the first `period` true ranges. Returns 0 when there are fewer than
    // period + 1 candles.
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // ATR value as of each candle index; 0 where not yet defined
    static std::vector<double> calculateATRSeries(const std::vector<Candle>& candles, int period = 14);

    static double calculateMedian(std::vector<double> values);
    static double calculateMean(const std::vector<double>& values);
};

} // namespace analytics
} // namespace fvgscan
