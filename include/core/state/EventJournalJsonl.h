#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>

#include "core/contracts/IEventJournal.h"

namespace patternedge {
namespace core {

// One JSON object per line, appended in place. Unreadable rows are skipped
// on replay so a torn final line never blocks startup.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::vector<JournalEvent> tail(std::size_t limit) override;
    std::uint64_t lastSeq() const override;

    std::size_t skippedRows() const;

private:
    // Caller holds mutex_
    void scan(const std::function<void(JournalEvent&&)>& visit);

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    std::size_t skipped_rows_ = 0;
};

} // namespace core
} // namespace patternedge
