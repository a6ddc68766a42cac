#pragma once

#include <string>
#include <vector>
#include <array>

namespace fvgscan {

using Timestamp = long long;   // epoch milliseconds
using DurationMs = long long;
using Price = double;
using Volume = double;
using Amount = double;

enum class TradeDirection { BUY, SELL };

// Bias of a zone or structural event
enum class MarketBias { BULLISH, BEARISH };

enum class Timeframe { M1, M5, M15, M30, H1, H4 };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;    // bar open time (ms)
    
    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}
    
    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

constexpr std::array<Timeframe, 6> kAllTimeframes = {
    Timeframe::H4, Timeframe::H1, Timeframe::M30,
    Timeframe::M15, Timeframe::M5, Timeframe::M1
};

std::string toString(Timeframe tf);
std::string toString(TradeDirection direction);
std::string toString(MarketBias bias);

// "1m", "5m", "15m", "30m", "1h"/"60m", "4h"/"240m"
Timeframe timeframeFromString(const std::string& value);
TradeDirection directionFromString(const std::string& value);

DurationMs timeframeDuration(Timeframe tf);

TradeDirection directionFromBias(MarketBias bias);
MarketBias biasFromDirection(TradeDirection direction);

// +1 for BUY, -1 for SELL
double directionSign(TradeDirection direction);

} // namespace fvgscan
