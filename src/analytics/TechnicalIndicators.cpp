#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace fvgscan {
namespace analytics {

std::vector<double> TechnicalIndicators::calculateTrueRanges(const std::vector<Candle>& candles) {
    std::vector<double> tr_values;
    if (candles.size() < 2) return tr_values;
    tr_values.reserve(candles.size() - 1);
    
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const auto& prev = candles[i-1];
        
        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev.close);
        double tr3 = std::abs(current.low - prev.close);
        
        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }
    return tr_values;
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }
    
    const auto tr_values = calculateTrueRanges(candles);

    // Seed: mean of the first period true ranges
    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;
    
    // Wilder: ATR_t = ATR_{t-1} + (TR_t - ATR_{t-1}) / period
    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = atr + (tr_values[i] - atr) / period;
    }
    
    return atr;
}

std::vector<double> TechnicalIndicators::calculateATRSeries(const std::vector<Candle>& candles, int period) {
    std::vector<double> out(candles.size(), 0.0);
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return out;
    }

    const auto tr_values = calculateTrueRanges(candles);

    // tr_values[k] belongs to candle k + 1
    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;
    out[period] = atr;

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = atr + (tr_values[i] - atr) / period;
        out[i + 1] = atr;
    }
    return out;
}

double TechnicalIndicators::calculateMedian(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace analytics
} // namespace fvgscan
