#include "data/CachingCandleProvider.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>

using namespace fvgscan;
using namespace fvgscan::data;
using namespace fvgscan::testsupport;

namespace {

const DurationMs kM5 = 5 * kMinuteMs;

// Serves M5 bars that have opened before the shared clock, counting every fetch
class CountingProvider : public core::ICandleProvider {
public:
    explicit CountingProvider(const Timestamp* now) : now_(now) {}

    CandleSeries getSeries(const std::string& symbol, Timeframe timeframe, Timestamp since_ms) override {
        ++calls;
        last_since = since_ms;
        std::vector<Candle> candles;
        for (Timestamp ts = kBaseTime; ts < *now_; ts += kM5) {
            if (ts >= since_ms) {
                const double close = (ts == *now_ - kM5) ? latest_close : 100.0;
                candles.push_back(bar(ts, 100.0, 101.0, 99.0, close));
            }
        }
        return CandleSeries(symbol, timeframe, std::move(candles));
    }

    int calls = 0;
    Timestamp last_since = 0;
    double latest_close = 100.0;

private:
    const Timestamp* now_;
};

const DurationMs kH4 = 240 * kMinuteMs;

// Three H4 bars; the newest reports a partial high until it has closed
class FormingBarProvider : public core::ICandleProvider {
public:
    FormingBarProvider(const Timestamp* now, Timestamp forming_open)
        : now_(now), forming_open_(forming_open) {}

    CandleSeries getSeries(const std::string& symbol, Timeframe timeframe, Timestamp since_ms) override {
        ++calls;
        last_since = since_ms;
        std::vector<Candle> candles;
        for (Timestamp ts = kBaseTime; ts <= forming_open_ && ts < *now_; ts += kH4) {
            if (ts < since_ms) continue;
            double high = 101.0;
            if (ts == forming_open_) {
                high = (ts + kH4 > *now_) ? 102.0 : 130.0;
            }
            candles.push_back(bar(ts, 100.0, high, 99.0, 100.0));
        }
        return CandleSeries(symbol, timeframe, std::move(candles));
    }

    int calls = 0;
    Timestamp last_since = 0;

private:
    const Timestamp* now_;
    Timestamp forming_open_;
};

} // namespace

int main() {
    std::cout << "[TEST] Starting SeriesCache Test..." << std::endl;

    Timestamp now = kBaseTime + 100 * kM5;
    auto upstream = std::make_shared<CountingProvider>(&now);
    auto cache = std::make_shared<SeriesCache>();
    CachingCandleProvider provider(upstream, cache, [&now]() { return now; });

    // 1. Cold fetch, then served from cache while fresh
    {
        auto series = provider.getSeries("US30", Timeframe::M5, kBaseTime);
        assert(series.size() == 100);
        assert(upstream->calls == 1);

        series = provider.getSeries("US30", Timeframe::M5, kBaseTime);
        assert(series.size() == 100);
        assert(upstream->calls == 1);

        series = provider.getSeries("US30", Timeframe::M5, kBaseTime + 50 * kM5);
        assert(series.size() == 50);
        assert(series.candles().front().timestamp == kBaseTime + 50 * kM5);
        assert(upstream->calls == 1);
    }

    // 2. Stale after one bar: incremental top-up from the newest cached bar
    {
        now += kM5;
        upstream->latest_close = 100.5;
        const auto series = provider.getSeries("US30", Timeframe::M5, kBaseTime);
        assert(upstream->calls == 2);
        assert(upstream->last_since == kBaseTime + 99 * kM5);
        assert(series.size() == 101);
        assert(series.back().close == 100.5);
    }

    // 3. A bar refetched while still forming replaces the cached copy
    {
        now += kM5;
        upstream->latest_close = 101.0;
        // bar 100 was the newest cached bar; the top-up starts there
        const auto series = provider.getSeries("US30", Timeframe::M5, kBaseTime);
        assert(upstream->last_since == kBaseTime + 100 * kM5);
        assert(series.size() == 102);
        assert(series[100].close == 100.0);
        assert(series.back().close == 101.0);
    }

    // 4. Asking further back than the cache covers forces a full fetch
    {
        const int before = upstream->calls;
        provider.getSeries("US30", Timeframe::M5, kBaseTime - 10 * kM5);
        assert(upstream->calls == before + 1);
        assert(upstream->last_since == kBaseTime - 10 * kM5);
    }

    // 5. Explicit TTL and per-series bar cap
    {
        SeriesCacheConfig config;
        config.ttl_ms = 2 * kMinuteMs;
        config.max_bars_per_series = 10;
        auto capped_cache = std::make_shared<SeriesCache>(config);
        CachingCandleProvider capped(upstream, capped_cache, [&now]() { return now; });

        const int before = upstream->calls;
        assert(capped.getSeries("XAUUSD", Timeframe::M5, kBaseTime).size() == 102);
        const auto entry = capped_cache->get("XAUUSD", Timeframe::M5);
        assert(entry && entry->series.size() == 10);
        assert(entry->covers_since == entry->series.candles().front().timestamp);
        assert(capped_cache->isFresh(*entry, now + kMinuteMs));
        assert(!capped_cache->isFresh(*entry, now + 2 * kMinuteMs));

        // truncated history no longer reaches back to kBaseTime
        capped.getSeries("XAUUSD", Timeframe::M5, kBaseTime);
        assert(upstream->calls == before + 2);
        assert(capped.getSeries("XAUUSD", Timeframe::M5, now - 5 * kM5).size() == 5);
        assert(upstream->calls == before + 2);
    }

    // 6. Least recently used entry is evicted first
    {
        SeriesCacheConfig config;
        config.max_entries = 2;
        SeriesCache small(config);
        small.put(CandleSeries("A", Timeframe::H1, {bar(kBaseTime, 1, 2, 0.5, 1.5)}), now, kBaseTime);
        small.put(CandleSeries("B", Timeframe::H1, {bar(kBaseTime, 1, 2, 0.5, 1.5)}), now, kBaseTime);
        assert(small.get("A", Timeframe::H1));
        small.put(CandleSeries("C", Timeframe::H1, {bar(kBaseTime, 1, 2, 0.5, 1.5)}), now, kBaseTime);
        assert(small.size() == 2);
        assert(!small.get("B", Timeframe::H1));
        assert(small.get("A", Timeframe::H1));
        assert(small.get("C", Timeframe::H1));

        small.evict("A", Timeframe::H1);
        assert(small.size() == 1);
        small.clear();
        assert(small.size() == 0);
    }

    // 7. A bar cached while forming is refetched once it has closed
    {
        const Timestamp forming_open = kBaseTime + 2 * kH4;
        Timestamp clock = forming_open + kH4 - kMinuteMs;
        auto h4_upstream = std::make_shared<FormingBarProvider>(&clock, forming_open);
        auto h4_cache = std::make_shared<SeriesCache>();
        CachingCandleProvider h4(h4_upstream, h4_cache, [&clock]() { return clock; });

        auto series = h4.getSeries("US30", Timeframe::H4, kBaseTime);
        assert(series.size() == 3);
        assert(series.back().high == 102.0);
        assert(series.closedAt(clock).size() == 2);

        // still forming: served from the cache
        clock += 30 * 1000;
        h4.getSeries("US30", Timeframe::H4, kBaseTime);
        assert(h4_upstream->calls == 1);

        // the bar has closed, well inside the one-bar TTL
        clock = forming_open + kH4 + kMinuteMs;
        const auto entry = h4_cache->get("US30", Timeframe::H4);
        assert(entry && !h4_cache->isFresh(*entry, clock));

        series = h4.getSeries("US30", Timeframe::H4, kBaseTime);
        assert(h4_upstream->calls == 2);
        assert(h4_upstream->last_since == forming_open);
        const auto closed = series.closedAt(clock);
        assert(closed.size() == 3);
        assert(closed.back().timestamp == forming_open);
        assert(closed.back().high == 130.0);
    }

    std::cout << "[TEST] SeriesCache Test PASSED!" << std::endl;
    return 0;
}
