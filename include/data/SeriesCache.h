#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "common/CandleSeries.h"

namespace fvgscan {
namespace data {

struct SeriesCacheConfig {
    size_t max_entries = 64;            // (symbol, timeframe) pairs, least recently used evicted
    size_t max_bars_per_series = 5000;
    DurationMs ttl_ms = 0;              // 0: one bar of the series' timeframe; never past the next bar close
};

struct CachedSeries {
    CandleSeries series;
    Timestamp fetched_at = 0;
    Timestamp covers_since = 0;     // earliest since_ms the series was fetched for
};

class SeriesCache {
public:
    explicit SeriesCache(SeriesCacheConfig config = SeriesCacheConfig());

    std::optional<CachedSeries> get(const std::string& symbol, Timeframe timeframe);
    void put(const CandleSeries& series, Timestamp fetched_at, Timestamp covers_since);

    bool isFresh(const CachedSeries& entry, Timestamp now) const;

    void evict(const std::string& symbol, Timeframe timeframe);
    void clear();
    size_t size() const;

private:
    using Key = std::pair<std::string, Timeframe>;

    struct Entry {
        CachedSeries cached;
        std::uint64_t last_access = 0;
    };

    void evictLeastRecentlyUsedLocked();
    static Timestamp nextBarCloseAfterFetch(const CachedSeries& entry, DurationMs duration);

    SeriesCacheConfig config_;
    std::map<Key, Entry> entries_;
    std::uint64_t access_counter_ = 0;
    mutable std::mutex mutex_;
};

} // namespace data
} // namespace fvgscan
