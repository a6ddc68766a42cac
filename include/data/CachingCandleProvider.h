#pragma once

#include <functional>
#include <memory>

#include "core/contracts/ICandleProvider.h"
#include "data/SeriesCache.h"

namespace fvgscan {
namespace data {

using Clock = std::function<Timestamp()>;

Timestamp systemNowMs();

// Serves fresh cached series; a stale entry is topped up incrementally from
// its last bar, which also refreshes a bar that was still forming.
class CachingCandleProvider : public core::ICandleProvider {
public:
    CachingCandleProvider(
        std::shared_ptr<core::ICandleProvider> upstream,
        std::shared_ptr<SeriesCache> cache,
        Clock clock = systemNowMs
    );

    CandleSeries getSeries(const std::string& symbol, Timeframe timeframe, Timestamp since_ms) override;

private:
    std::shared_ptr<core::ICandleProvider> upstream_;
    std::shared_ptr<SeriesCache> cache_;
    Clock clock_;
};

} // namespace data
} // namespace fvgscan
