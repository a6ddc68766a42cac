#pragma once

#include <string>
#include <vector>

#include "common/CandleSeries.h"
#include "core/contracts/INotificationSink.h"
#include "core/model/TradeTypes.h"

namespace fvgscan {
namespace testsupport {

// 2023-11-14 20:00:00 UTC, aligned to a 4h boundary
constexpr Timestamp kBaseTime = 1699992000000LL;
constexpr DurationMs kMinuteMs = 60LL * 1000;

inline Candle bar(Timestamp ts, double open, double high, double low, double close) {
    return Candle(open, high, low, close, 1.0, ts);
}

// n bars ranging low..high around `close`, the last one closing exactly at `end_close`
inline CandleSeries flatSeries(const std::string& symbol, Timeframe tf, size_t n,
                               Timestamp end_close, double close, double half_range = 0.5) {
    const DurationMs duration = timeframeDuration(tf);
    std::vector<Candle> candles;
    for (size_t k = 0; k < n; ++k) {
        const Timestamp ts = end_close - static_cast<Timestamp>(n - k) * duration;
        candles.push_back(bar(ts, close, close + half_range, close - half_range, close));
    }
    return CandleSeries(symbol, tf, std::move(candles));
}

class RecordingSink : public core::INotificationSink {
public:
    void emit(const core::NotificationEvent& event) override {
        events.push_back(event);
    }

    size_t count(core::NotificationType type) const {
        size_t n = 0;
        for (const auto& event : events) {
            if (event.type == type) ++n;
        }
        return n;
    }

    std::vector<core::NotificationEvent> events;
};

inline core::Signal makeSignal(const std::string& id, TradeDirection direction,
                               double entry, double stop_loss, double take_profit,
                               Timestamp time, const std::string& symbol = "US30") {
    core::Signal signal;
    signal.id = id;
    signal.symbol = symbol;
    signal.direction = direction;
    signal.time = time;
    signal.h4_bar_time = time;
    signal.entry_price = entry;
    signal.strategy_name = "test";
    signal.risk_plan.stop_loss = stop_loss;
    signal.risk_plan.take_profit = take_profit;
    signal.risk_plan.stop_distance = (entry > stop_loss) ? entry - stop_loss : stop_loss - entry;
    return signal;
}

inline bool near(double a, double b, double eps = 1e-9) {
    return (a > b ? a - b : b - a) < eps;
}

} // namespace testsupport
} // namespace fvgscan
