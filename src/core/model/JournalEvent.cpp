#include "core/model/JournalEvent.h"

#include <array>
#include <utility>

namespace patternedge {
namespace core {

namespace {
const std::array<std::pair<JournalEventType, const char*>, 9> kTypeNames{{
    {JournalEventType::SIGNAL_ACCEPTED, "SIGNAL_ACCEPTED"},
    {JournalEventType::SIGNAL_REJECTED, "SIGNAL_REJECTED"},
    {JournalEventType::TRADE_OPENED, "TRADE_OPENED"},
    {JournalEventType::TRADE_CANCELLED, "TRADE_CANCELLED"},
    {JournalEventType::TRADE_CLOSED, "TRADE_CLOSED"},
    {JournalEventType::BREAKER_TRIPPED, "BREAKER_TRIPPED"},
    {JournalEventType::BREAKERS_RESET, "BREAKERS_RESET"},
    {JournalEventType::OUTCOMES_INGESTED, "OUTCOMES_INGESTED"},
    {JournalEventType::REGIME_DETECTED, "REGIME_DETECTED"},
}};
}

std::string toString(JournalEventType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.first == type) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

std::optional<JournalEventType> journalEventTypeFromString(const std::string& value) {
    for (const auto& entry : kTypeNames) {
        if (value == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

nlohmann::json toJson(const JournalEvent& event) {
    nlohmann::json row;
    row["seq"] = event.seq;
    row["ts_ms"] = event.ts_ms;
    row["type"] = toString(event.type);
    row["instrument"] = event.instrument;
    row["entity_id"] = event.entity_id;
    row["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;
    return row;
}

std::optional<JournalEvent> journalEventFromJson(const nlohmann::json& row) {
    if (!row.is_object() || !row.contains("seq") || !row["seq"].is_number_unsigned()) {
        return std::nullopt;
    }
    const auto type = journalEventTypeFromString(row.value("type", std::string()));
    if (!type) {
        return std::nullopt;
    }

    JournalEvent event;
    event.seq = row["seq"].get<std::uint64_t>();
    event.ts_ms = row.value("ts_ms", 0LL);
    event.type = *type;
    event.instrument = row.value("instrument", std::string());
    event.entity_id = row.value("entity_id", std::string());
    event.payload = row.value("payload", nlohmann::json::object());
    return event;
}

} // namespace core
} // namespace patternedge
