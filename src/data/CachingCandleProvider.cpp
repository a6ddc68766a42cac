#include "data/CachingCandleProvider.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <chrono>

namespace fvgscan {
namespace data {

Timestamp systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

CachingCandleProvider::CachingCandleProvider(
    std::shared_ptr<core::ICandleProvider> upstream,
    std::shared_ptr<SeriesCache> cache,
    Clock clock
)
    : upstream_(std::move(upstream))
    , cache_(std::move(cache))
    , clock_(std::move(clock))
{
    if (!upstream_ || !cache_ || !clock_) {
        throw InvariantViolation("CachingCandleProvider requires an upstream provider, a cache and a clock");
    }
}

CandleSeries CachingCandleProvider::getSeries(const std::string& symbol, Timeframe timeframe, Timestamp since_ms) {
    const Timestamp now = clock_();
    const auto cached = cache_->get(symbol, timeframe);

    // cached history must reach back to since_ms to be reused
    const bool covers = cached && !cached->series.empty() && cached->covers_since <= since_ms;

    if (covers && cache_->isFresh(*cached, now)) {
        return cached->series.since(since_ms);
    }

    CandleSeries merged;
    Timestamp covers_since = since_ms;
    if (covers) {
        covers_since = cached->covers_since;
        const Timestamp resume_from = cached->series.lastTimestamp();
        CandleSeries fetched = upstream_->getSeries(symbol, timeframe, resume_from);
        merged = cached->series.mergedWith(fetched.candles());
        LOG_DEBUG("{} {}: topped up {} bars from {}", symbol, toString(timeframe), fetched.size(), resume_from);
    } else {
        merged = upstream_->getSeries(symbol, timeframe, since_ms);
    }

    cache_->put(merged, now, covers_since);
    return merged.since(since_ms);
}

} // namespace data
} // namespace fvgscan
