#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <vector>

#include "core/contracts/INotificationSink.h"

namespace fvgscan {
namespace core {

struct JournalEntry {
    std::uint64_t seq = 0;
    NotificationEvent event;
};

// Append-only JSON lines, one sequenced notification per line
class NotificationJournalJsonl : public INotificationSink {
public:
    explicit NotificationJournalJsonl(std::filesystem::path file_path);

    void emit(const NotificationEvent& event) override;

    bool append(const NotificationEvent& event);
    std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq() const;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace fvgscan
