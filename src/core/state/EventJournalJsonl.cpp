#include "core/state/EventJournalJsonl.h"

#include <algorithm>
#include <deque>
#include <fstream>
#include <iterator>

#include "common/Logger.h"

namespace patternedge {
namespace core {

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::lock_guard<std::mutex> lock(mutex_);
    scan([this](JournalEvent&& event) {
        last_seq_ = (std::max)(last_seq_, event.seq);
    });
    if (skipped_rows_ > 0) {
        LOG_WARN("journal {}: {} unreadable rows skipped", file_path_.string(), skipped_rows_);
    }
}

void EventJournalJsonl::scan(const std::function<void(JournalEvent&&)>& visit) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::size_t skipped = 0;
    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const auto parsed = nlohmann::json::parse(row, nullptr, false);
        if (parsed.is_discarded()) {
            ++skipped;
            continue;
        }
        auto event = journalEventFromJson(parsed);
        if (!event) {
            ++skipped;
            continue;
        }
        visit(std::move(*event));
    }
    skipped_rows_ = skipped;
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("journal {}: cannot open for append", file_path_.string());
        return false;
    }

    JournalEvent stamped = event;
    stamped.seq = last_seq_ + 1;
    out << toJson(stamped).dump() << "\n";
    out.flush();
    if (!out) {
        LOG_ERROR("journal {}: write failed at seq {}", file_path_.string(), stamped.seq);
        return false;
    }
    last_seq_ = stamped.seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JournalEvent> out;
    scan([&out, seq_inclusive](JournalEvent&& event) {
        if (event.seq >= seq_inclusive) {
            out.push_back(std::move(event));
        }
    });
    return out;
}

std::vector<JournalEvent> EventJournalJsonl::tail(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::deque<JournalEvent> window;
    if (limit == 0) {
        return {};
    }
    scan([&window, limit](JournalEvent&& event) {
        window.push_back(std::move(event));
        if (window.size() > limit) {
            window.pop_front();
        }
    });
    return std::vector<JournalEvent>(std::make_move_iterator(window.begin()),
                                     std::make_move_iterator(window.end()));
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::size_t EventJournalJsonl::skippedRows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skipped_rows_;
}

} // namespace core
} // namespace patternedge
