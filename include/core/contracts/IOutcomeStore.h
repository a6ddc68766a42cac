#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/model/TradeTypes.h"

namespace fvgscan {
namespace core {

class IOutcomeStore {
public:
    virtual ~IOutcomeStore() = default;

    virtual std::vector<ClosedTradeOutcome> queryClosedTrades(
        const std::string& symbol,
        TradeDirection direction
    ) = 0;

    // Assigns and returns the trade id. Throws InvariantViolation if the
    // signal already has a trade.
    virtual std::string createTrade(const Trade& trade) = 0;

    // Applies update only if the stored state still equals expected_state
    virtual bool compareAndSetTrade(
        const std::string& trade_id,
        TradeState expected_state,
        const TradeUpdate& update
    ) = 0;

    virtual std::optional<Trade> getTrade(const std::string& trade_id) = 0;
    virtual std::vector<Trade> openTrades(const std::string& symbol) = 0;
};

} // namespace core
} // namespace fvgscan
