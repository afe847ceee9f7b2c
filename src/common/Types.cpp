#include "common/Types.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace patternedge {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::string toString(Direction direction) {
    switch (direction) {
        case Direction::BULLISH: return "bullish";
        case Direction::BEARISH: return "bearish";
        case Direction::NEUTRAL: return "neutral";
    }
    return "neutral";
}

std::string toString(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::HIGH: return "HIGH";
        case ConfidenceLevel::MEDIUM: return "MEDIUM";
        case ConfidenceLevel::LOW: return "LOW";
    }
    return "LOW";
}

std::string toString(Tier tier) {
    switch (tier) {
        case Tier::TIER_1: return "tier_1";
        case Tier::TIER_2: return "tier_2";
        case Tier::TIER_3: return "tier_3";
        case Tier::TIER_4: return "tier_4";
    }
    return "tier_4";
}

std::string toString(TradeStatus status) {
    switch (status) {
        case TradeStatus::OPEN: return "OPEN";
        case TradeStatus::CLOSED_SL: return "CLOSED_SL";
        case TradeStatus::CLOSED_TARGET: return "CLOSED_TARGET";
        case TradeStatus::CLOSED_EXPIRY: return "CLOSED_EXPIRY";
        case TradeStatus::CANCELLED: return "CANCELLED";
    }
    return "OPEN";
}

Direction directionFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "bullish" || v == "long") return Direction::BULLISH;
    if (v == "bearish" || v == "short") return Direction::BEARISH;
    return Direction::NEUTRAL;
}

ConfidenceLevel confidenceLevelFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "high") return ConfidenceLevel::HIGH;
    if (v == "medium") return ConfidenceLevel::MEDIUM;
    return ConfidenceLevel::LOW;
}

std::optional<Tier> tierFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "tier_1" || v == "1") return Tier::TIER_1;
    if (v == "tier_2" || v == "2") return Tier::TIER_2;
    if (v == "tier_3" || v == "3") return Tier::TIER_3;
    if (v == "tier_4" || v == "4") return Tier::TIER_4;
    return std::nullopt;
}

TradeStatus tradeStatusFromString(const std::string& value) {
    if (value == "OPEN") return TradeStatus::OPEN;
    if (value == "CLOSED_SL") return TradeStatus::CLOSED_SL;
    if (value == "CLOSED_TARGET") return TradeStatus::CLOSED_TARGET;
    if (value == "CLOSED_EXPIRY") return TradeStatus::CLOSED_EXPIRY;
    if (value == "CANCELLED") return TradeStatus::CANCELLED;
    throw std::invalid_argument("unknown trade status: " + value);
}

bool isTerminal(TradeStatus status) {
    return status != TradeStatus::OPEN;
}

std::string horizonLabel(int horizon_days) {
    if (horizon_days == 1) {
        return "BTST_1d";
    }
    return "Swing_" + std::to_string(horizon_days) + "d";
}

long long getCurrentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace patternedge
