#include "risk/HistoricalOutcomeStats.h"
#include "analytics/TechnicalIndicators.h"

namespace fvgscan {
namespace risk {

HistoricalOutcomeStats HistoricalOutcomeStats::fromOutcomes(const std::vector<core::ClosedTradeOutcome>& outcomes) {
    HistoricalOutcomeStats stats;
    std::vector<double> maes;
    std::vector<double> mfes;
    std::vector<double> r_multiples;
    std::vector<double> winner_holdings;

    for (const auto& outcome : outcomes) {
        stats.sample_count++;
        maes.push_back(outcome.mae);
        mfes.push_back(outcome.mfe);
        r_multiples.push_back(outcome.r_multiple);
        if (outcome.r_multiple > 0.0) {
            stats.winners++;
            winner_holdings.push_back(static_cast<double>(outcome.holding_duration));
        }
    }

    stats.median_mae = analytics::TechnicalIndicators::calculateMedian(maes);
    stats.median_mfe = analytics::TechnicalIndicators::calculateMedian(mfes);
    stats.mean_r = analytics::TechnicalIndicators::calculateMean(r_multiples);
    stats.median_winner_holding = static_cast<DurationMs>(
        analytics::TechnicalIndicators::calculateMedian(winner_holdings)
    );
    return stats;
}

} // namespace risk
} // namespace fvgscan
