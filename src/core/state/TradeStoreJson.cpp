#include "core/state/TradeStoreJson.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace fvgscan {
namespace core {

namespace {
constexpr int kSchemaVersion = 1;

std::string formatTradeId(std::uint64_t n) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "T%06llu", static_cast<unsigned long long>(n));
    return buffer;
}
}

TradeStoreJson::TradeStoreJson(size_t history_limit)
    : history_limit_(history_limit) {}

TradeStoreJson::TradeStoreJson(std::filesystem::path file_path, size_t history_limit)
    : file_path_(std::move(file_path))
    , history_limit_(history_limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked();
}

std::vector<ClosedTradeOutcome> TradeStoreJson::queryClosedTrades(
    const std::string& symbol,
    TradeDirection direction
) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const Trade*> closed;
    for (const auto& [id, trade] : trades_) {
        if (trade.symbol == symbol && trade.direction == direction && isTerminal(trade.state)) {
            closed.push_back(&trade);
        }
    }

    // newest first, bounded
    std::sort(closed.begin(), closed.end(), [](const Trade* a, const Trade* b) {
        return a->close_time > b->close_time;
    });
    if (history_limit_ > 0 && closed.size() > history_limit_) {
        closed.resize(history_limit_);
    }

    std::vector<ClosedTradeOutcome> outcomes;
    outcomes.reserve(closed.size());
    for (const Trade* trade : closed) {
        outcomes.push_back(ClosedTradeOutcome::fromTrade(*trade));
    }
    return outcomes;
}

std::string TradeStoreJson::createTrade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!trade.signal_id.empty() && signal_ids_.count(trade.signal_id) > 0) {
        throw InvariantViolation("signal " + trade.signal_id + " already has a trade");
    }

    Trade stored = trade;
    stored.id = formatTradeId(next_id_++);
    signal_ids_.insert(stored.signal_id);
    trades_[stored.id] = stored;

    if (!saveLocked()) {
        LOG_ERROR("trade {} kept in memory only, snapshot write failed", stored.id);
    }
    return stored.id;
}

bool TradeStoreJson::compareAndSetTrade(
    const std::string& trade_id,
    TradeState expected_state,
    const TradeUpdate& update
) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = trades_.find(trade_id);
    if (it == trades_.end() || it->second.state != expected_state) {
        return false;
    }
    update.applyTo(it->second);

    if (!saveLocked()) {
        LOG_ERROR("trade {} update kept in memory only, snapshot write failed", trade_id);
    }
    return true;
}

std::optional<Trade> TradeStoreJson::getTrade(const std::string& trade_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Trade> TradeStoreJson::openTrades(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trade> out;
    for (const auto& [id, trade] : trades_) {
        if (trade.state == TradeState::OPEN && (symbol.empty() || trade.symbol == symbol)) {
            out.push_back(trade);
        }
    }
    return out;
}

size_t TradeStoreJson::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

void TradeStoreJson::loadLocked() {
    if (!file_path_ || !std::filesystem::exists(*file_path_)) {
        return;
    }

    std::ifstream in(*file_path_, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("trade store {} exists but cannot be opened", file_path_->string());
        return;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        next_id_ = raw.value("next_id", static_cast<std::uint64_t>(1));
        for (const auto& item : raw.value("trades", nlohmann::json::array())) {
            Trade trade = tradeFromJson(item);
            signal_ids_.insert(trade.signal_id);
            trades_[trade.id] = trade;
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvariantViolation("trade store " + file_path_->string() + " is corrupt: " + e.what());
    }

    LOG_INFO("trade store loaded {} trades from {}", trades_.size(), file_path_->string());
}

bool TradeStoreJson::saveLocked() const {
    if (!file_path_) {
        return true;
    }

    nlohmann::json raw;
    raw["schema_version"] = kSchemaVersion;
    raw["next_id"] = next_id_;
    raw["trades"] = nlohmann::json::array();
    for (const auto& [id, trade] : trades_) {
        raw["trades"].push_back(toJson(trade));
    }

    std::error_code ec;
    if (file_path_->has_parent_path()) {
        std::filesystem::create_directories(file_path_->parent_path(), ec);
    }

    auto tmp_path = *file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        if (!out) {
            return false;
        }
    }

    ec.clear();
    std::filesystem::rename(tmp_path, *file_path_, ec);
    return !ec;
}

} // namespace core
} // namespace fvgscan
