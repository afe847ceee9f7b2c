#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace patternedge {
namespace core {

enum class JournalEventType {
    SIGNAL_ACCEPTED,
    SIGNAL_REJECTED,
    TRADE_OPENED,
    TRADE_CANCELLED,
    TRADE_CLOSED,
    BREAKER_TRIPPED,
    BREAKERS_RESET,
    OUTCOMES_INGESTED,
    REGIME_DETECTED
};

// One audit row. entity_id is a trade id, a horizon label or a date
// depending on the event type.
struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::SIGNAL_ACCEPTED;
    std::string instrument;
    std::string entity_id;
    nlohmann::json payload;
};

std::string toString(JournalEventType type);
std::optional<JournalEventType> journalEventTypeFromString(const std::string& value);

nlohmann::json toJson(const JournalEvent& event);

// nullopt for rows without a seq or with an unknown type
std::optional<JournalEvent> journalEventFromJson(const nlohmann::json& row);

} // namespace core
} // namespace patternedge
