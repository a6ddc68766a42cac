#include "core/state/NotificationJournalJsonl.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace fvgscan {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

NotificationJournalJsonl::NotificationJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("skipping malformed journal line in {}: {}", file_path_.string(), e.what());
        }
    }
}

void NotificationJournalJsonl::emit(const NotificationEvent& event) {
    if (!append(event)) {
        LOG_ERROR("failed to journal {} for trade {} to {}",
                  toString(event.type), event.trade_id, file_path_.string());
    }
}

bool NotificationJournalJsonl::append(const NotificationEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["trade_id"] = event.trade_id;
    line["symbol"] = event.symbol;
    line["direction"] = toString(event.direction);
    line["payload"] = event.payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEntry> NotificationJournalJsonl::readFrom(std::uint64_t seq_inclusive) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEntry> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        try {
            const nlohmann::json line = nlohmann::json::parse(row);
            const auto seq = parseSeq(line);
            if (seq < seq_inclusive) {
                continue;
            }

            JournalEntry entry;
            entry.seq = seq;
            entry.event.ts_ms = line.value("ts_ms", 0LL);
            entry.event.type = notificationTypeFromString(line.value("type", std::string()));
            entry.event.trade_id = line.value("trade_id", std::string());
            entry.event.symbol = line.value("symbol", std::string());
            entry.event.direction = directionFromString(line.value("direction", std::string("buy")));
            entry.event.payload = line.value("payload", nlohmann::json::object());
            out.push_back(std::move(entry));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("skipping malformed journal line: {}", e.what());
        } catch (const InvariantViolation& e) {
            LOG_WARN("skipping journal line with unknown value: {}", e.what());
        }
    }

    return out;
}

std::uint64_t NotificationJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace fvgscan
