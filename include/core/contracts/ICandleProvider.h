#pragma once

#include <string>

#include "common/CandleSeries.h"
#include "common/Types.h"

namespace fvgscan {
namespace core {

class ICandleProvider {
public:
    virtual ~ICandleProvider() = default;

    // Bars with timestamp >= since_ms, sorted and unique. May return fewer
    // bars than exist upstream. Throws DataUnavailable on total failure.
    virtual CandleSeries getSeries(const std::string& symbol, Timeframe timeframe, Timestamp since_ms) = 0;
};

} // namespace core
} // namespace fvgscan
