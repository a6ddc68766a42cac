#include "data/SeriesCache.h"
#include "common/Logger.h"

namespace fvgscan {
namespace data {

SeriesCache::SeriesCache(SeriesCacheConfig config)
    : config_(config) {}

std::optional<CachedSeries> SeriesCache::get(const std::string& symbol, Timeframe timeframe) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(Key(symbol, timeframe));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    it->second.last_access = ++access_counter_;
    return it->second.cached;
}

void SeriesCache::put(const CandleSeries& series, Timestamp fetched_at, Timestamp covers_since) {
    std::lock_guard<std::mutex> lock(mutex_);

    Entry entry;
    entry.cached.series = (config_.max_bars_per_series > 0) ? series.tail(config_.max_bars_per_series) : series;
    entry.cached.fetched_at = fetched_at;
    entry.cached.covers_since = covers_since;
    if (entry.cached.series.size() < series.size() && !entry.cached.series.empty()) {
        entry.cached.covers_since = entry.cached.series.candles().front().timestamp;
    }
    entry.last_access = ++access_counter_;
    entries_[Key(series.symbol(), series.timeframe())] = std::move(entry);

    while (config_.max_entries > 0 && entries_.size() > config_.max_entries) {
        evictLeastRecentlyUsedLocked();
    }
}

bool SeriesCache::isFresh(const CachedSeries& entry, Timestamp now) const {
    const DurationMs duration = timeframeDuration(entry.series.timeframe());
    const DurationMs ttl = (config_.ttl_ms > 0) ? config_.ttl_ms : duration;
    if (now - entry.fetched_at >= ttl) {
        return false;
    }
    // a bar that closed after the fetch may have been cached while still forming
    return now < nextBarCloseAfterFetch(entry, duration);
}

Timestamp SeriesCache::nextBarCloseAfterFetch(const CachedSeries& entry, DurationMs duration) {
    const Timestamp anchor = entry.series.empty() ? 0 : entry.series.lastTimestamp();
    if (entry.fetched_at < anchor) {
        return anchor + duration;
    }
    return anchor + ((entry.fetched_at - anchor) / duration + 1) * duration;
}

void SeriesCache::evict(const std::string& symbol, Timeframe timeframe) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(Key(symbol, timeframe));
}

void SeriesCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t SeriesCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void SeriesCache::evictLeastRecentlyUsedLocked() {
    auto oldest = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.last_access < oldest->second.last_access) {
            oldest = it;
        }
    }
    if (oldest != entries_.end()) {
        LOG_DEBUG("series cache evicting {} {}", oldest->first.first, toString(oldest->first.second));
        entries_.erase(oldest);
    }
}

} // namespace data
} // namespace fvgscan
