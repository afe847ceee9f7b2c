#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/model/JournalEvent.h"

namespace patternedge {
namespace core {

// Append-only audit trail. seq is assigned by the journal and strictly increasing.
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    // Last `limit` events, oldest first
    virtual std::vector<JournalEvent> tail(std::size_t limit) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace patternedge
