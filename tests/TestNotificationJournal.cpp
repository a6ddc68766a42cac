#include "core/state/NotificationJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    using namespace fvgscan::core;

    const auto path = std::filesystem::temp_directory_path() / "fvgscan_test" / "notifications.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    NotificationJournalJsonl journal(path);

    NotificationEvent first;
    first.ts_ms = 1000;
    first.type = NotificationType::SIGNAL_ACCEPTED;
    first.trade_id = "T000001";
    first.symbol = "US30";
    first.direction = fvgscan::TradeDirection::BUY;
    first.payload["entry_price"] = 34000.0;

    NotificationEvent second;
    second.ts_ms = 2000;
    second.type = NotificationType::CLOSED_BY_TP;
    second.trade_id = "T000001";
    second.symbol = "US30";
    second.payload["r_multiple"] = 2.0;

    if (!journal.append(first)) {
        std::cerr << "[TEST] append(first) failed\n";
        return 1;
    }
    journal.emit(second);

    if (journal.lastSeq() != 2) {
        std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
        return 1;
    }

    const auto rows = journal.readFrom(2);
    if (rows.size() != 1) {
        std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
        return 1;
    }
    if (rows.front().event.type != NotificationType::CLOSED_BY_TP ||
        rows.front().event.payload.value("r_multiple", 0.0) != 2.0) {
        std::cerr << "[TEST] unexpected row: " << toString(rows.front().event.type) << "\n";
        return 1;
    }

    // a garbage line is skipped, and sequencing resumes after reopening
    {
        std::ofstream out(path, std::ios::app);
        out << "not json\n";
    }
    NotificationJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }
    reopened.emit(first);
    const auto all = reopened.readFrom(1);
    if (all.size() != 3 || all.back().seq != 3 || all.front().event.symbol != "US30") {
        std::cerr << "[TEST] expected 3 sequenced rows, got " << all.size() << "\n";
        return 1;
    }

    std::filesystem::remove_all(path.parent_path(), ec);
    std::cout << "[TEST] NotificationJournal PASSED\n";
    return 0;
}
