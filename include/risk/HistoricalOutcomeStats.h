#pragma once

#include <vector>

#include "core/model/TradeTypes.h"

namespace fvgscan {
namespace risk {

// Aggregate of closed trades for one (symbol, direction)
struct HistoricalOutcomeStats {
    int sample_count = 0;
    int winners = 0;
    double median_mae = 0.0;
    double median_mfe = 0.0;
    double mean_r = 0.0;
    DurationMs median_winner_holding = 0;

    double winRate() const {
        return (sample_count > 0) ? (static_cast<double>(winners) / static_cast<double>(sample_count)) : 0.0;
    }

    static HistoricalOutcomeStats fromOutcomes(const std::vector<core::ClosedTradeOutcome>& outcomes);
};

} // namespace risk
} // namespace fvgscan
