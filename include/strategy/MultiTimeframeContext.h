#pragma once

#include <map>
#include <optional>
#include <string>

#include "common/CandleSeries.h"
#include "common/Types.h"

namespace fvgscan {
namespace strategy {

// Snapshot of every timeframe for one symbol at `now`. Series may still
// contain a forming bar; the strategy slices them to closed bars itself.
struct MultiTimeframeContext {
    std::string symbol;
    Timestamp now = 0;
    double current_price = 0.0;
    std::optional<Timestamp> last_seen_h4;      // newest H4 close already evaluated
    std::map<Timeframe, CandleSeries> series;

    const CandleSeries* find(Timeframe timeframe) const {
        auto it = series.find(timeframe);
        return (it != series.end()) ? &it->second : nullptr;
    }
};

} // namespace strategy
} // namespace fvgscan
