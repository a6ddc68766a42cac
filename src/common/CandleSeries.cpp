#include "common/CandleSeries.h"
#include "common/Errors.h"

#include <algorithm>

namespace fvgscan {

CandleSeries::CandleSeries(std::string symbol, Timeframe timeframe, std::vector<Candle> candles)
    : symbol_(std::move(symbol))
    , timeframe_(timeframe)
    , candles_(std::move(candles)) {
    for (size_t i = 1; i < candles_.size(); ++i) {
        if (candles_[i].timestamp <= candles_[i - 1].timestamp) {
            throw InvariantViolation(
                "candle series " + symbol_ + "/" + toString(timeframe_) +
                " has duplicate or out-of-order timestamp at index " + std::to_string(i)
            );
        }
    }
}

Timestamp CandleSeries::closeTimeOf(size_t index) const {
    return candles_[index].timestamp + timeframeDuration(timeframe_);
}

CandleSeries CandleSeries::closedAt(Timestamp now) const {
    const DurationMs duration = timeframeDuration(timeframe_);
    auto first_open = std::find_if(candles_.begin(), candles_.end(), [&](const Candle& c) {
        return c.timestamp + duration > now;
    });

    CandleSeries out;
    out.symbol_ = symbol_;
    out.timeframe_ = timeframe_;
    out.candles_.assign(candles_.begin(), first_open);
    return out;
}

std::vector<Candle> CandleSeries::barsAfter(Timestamp after) const {
    std::vector<Candle> out;
    for (const auto& candle : candles_) {
        if (candle.timestamp > after) {
            out.push_back(candle);
        }
    }
    return out;
}

CandleSeries CandleSeries::mergedWith(const std::vector<Candle>& newer) const {
    if (newer.empty()) {
        return *this;
    }
    const Timestamp first_new = newer.front().timestamp;
    std::vector<Candle> merged;
    merged.reserve(candles_.size() + newer.size());
    for (const auto& candle : candles_) {
        if (candle.timestamp < first_new) {
            merged.push_back(candle);
        }
    }
    merged.insert(merged.end(), newer.begin(), newer.end());
    return CandleSeries(symbol_, timeframe_, std::move(merged));
}

CandleSeries CandleSeries::tail(size_t max_bars) const {
    if (candles_.size() <= max_bars) {
        return *this;
    }
    CandleSeries out;
    out.symbol_ = symbol_;
    out.timeframe_ = timeframe_;
    out.candles_.assign(candles_.end() - static_cast<std::ptrdiff_t>(max_bars), candles_.end());
    return out;
}

CandleSeries CandleSeries::since(Timestamp since_ms) const {
    CandleSeries out;
    out.symbol_ = symbol_;
    out.timeframe_ = timeframe_;
    for (const auto& candle : candles_) {
        if (candle.timestamp >= since_ms) {
            out.candles_.push_back(candle);
        }
    }
    return out;
}

} // namespace fvgscan
