#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>

#include "core/contracts/IOutcomeStore.h"

namespace fvgscan {
namespace core {

// In-memory trade store with an optional JSON snapshot written after every change
class TradeStoreJson : public IOutcomeStore {
public:
    explicit TradeStoreJson(size_t history_limit = 100);
    TradeStoreJson(std::filesystem::path file_path, size_t history_limit = 100);

    std::vector<ClosedTradeOutcome> queryClosedTrades(
        const std::string& symbol,
        TradeDirection direction
    ) override;
    std::string createTrade(const Trade& trade) override;
    bool compareAndSetTrade(
        const std::string& trade_id,
        TradeState expected_state,
        const TradeUpdate& update
    ) override;
    std::optional<Trade> getTrade(const std::string& trade_id) override;
    std::vector<Trade> openTrades(const std::string& symbol) override;

    size_t size() const;

private:
    void loadLocked();
    bool saveLocked() const;

    std::optional<std::filesystem::path> file_path_;
    size_t history_limit_;
    std::map<std::string, Trade> trades_;
    std::set<std::string> signal_ids_;
    std::uint64_t next_id_ = 1;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace fvgscan
