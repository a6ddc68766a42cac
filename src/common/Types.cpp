#include "common/Types.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace fvgscan {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::string toString(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return "1m";
        case Timeframe::M5: return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::M30: return "30m";
        case Timeframe::H1: return "1h";
        case Timeframe::H4: return "4h";
    }
    return "1m";
}

std::string toString(TradeDirection direction) {
    switch (direction) {
        case TradeDirection::BUY: return "buy";
        case TradeDirection::SELL: return "sell";
    }
    return "buy";
}

std::string toString(MarketBias bias) {
    switch (bias) {
        case MarketBias::BULLISH: return "bullish";
        case MarketBias::BEARISH: return "bearish";
    }
    return "bullish";
}

Timeframe timeframeFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "1m" || v == "m1") return Timeframe::M1;
    if (v == "5m" || v == "m5") return Timeframe::M5;
    if (v == "15m" || v == "m15") return Timeframe::M15;
    if (v == "30m" || v == "m30") return Timeframe::M30;
    if (v == "1h" || v == "60m" || v == "h1") return Timeframe::H1;
    if (v == "4h" || v == "240m" || v == "h4") return Timeframe::H4;
    throw ConfigError("unknown timeframe: " + value);
}

TradeDirection directionFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "buy") return TradeDirection::BUY;
    if (v == "sell") return TradeDirection::SELL;
    throw InvariantViolation("direction must be buy or sell, got: " + value);
}

DurationMs timeframeDuration(Timeframe tf) {
    constexpr DurationMs minute = 60LL * 1000LL;
    switch (tf) {
        case Timeframe::M1: return minute;
        case Timeframe::M5: return 5 * minute;
        case Timeframe::M15: return 15 * minute;
        case Timeframe::M30: return 30 * minute;
        case Timeframe::H1: return 60 * minute;
        case Timeframe::H4: return 240 * minute;
    }
    return minute;
}

TradeDirection directionFromBias(MarketBias bias) {
    return bias == MarketBias::BULLISH ? TradeDirection::BUY : TradeDirection::SELL;
}

MarketBias biasFromDirection(TradeDirection direction) {
    return direction == TradeDirection::BUY ? MarketBias::BULLISH : MarketBias::BEARISH;
}

double directionSign(TradeDirection direction) {
    return direction == TradeDirection::BUY ? 1.0 : -1.0;
}

} // namespace fvgscan
