#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace fvgscan {

// Immutable, strictly time-ordered bars for one (symbol, timeframe).
class CandleSeries {
public:
    CandleSeries() = default;

    // Throws InvariantViolation on duplicate or out-of-order timestamps
    CandleSeries(std::string symbol, Timeframe timeframe, std::vector<Candle> candles);

    const std::string& symbol() const { return symbol_; }
    Timeframe timeframe() const { return timeframe_; }
    const std::vector<Candle>& candles() const { return candles_; }

    size_t size() const { return candles_.size(); }
    bool empty() const { return candles_.empty(); }
    const Candle& operator[](size_t index) const { return candles_[index]; }
    const Candle& back() const { return candles_.back(); }

    Timestamp lastTimestamp() const { return candles_.empty() ? 0 : candles_.back().timestamp; }
    Timestamp closeTimeOf(size_t index) const;

    // Prefix of bars whose close time (open + timeframe) is <= now
    CandleSeries closedAt(Timestamp now) const;

    // Bars with timestamp > after, in order
    std::vector<Candle> barsAfter(Timestamp after) const;

    // Bars of `newer` replace every bar from newer.front().timestamp onward,
    // so a refetched forming bar overwrites the cached one
    CandleSeries mergedWith(const std::vector<Candle>& newer) const;

    CandleSeries tail(size_t max_bars) const;
    CandleSeries since(Timestamp since_ms) const;

private:
    std::string symbol_;
    Timeframe timeframe_ = Timeframe::M1;
    std::vector<Candle> candles_;
};

} // namespace fvgscan
