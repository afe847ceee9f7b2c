#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace patternedge {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Amount = double;

enum class Direction { BULLISH, BEARISH, NEUTRAL };
enum class ConfidenceLevel { LOW, MEDIUM, HIGH };

// Retrieval tier, most specific first
enum class Tier { TIER_1 = 1, TIER_2 = 2, TIER_3 = 3, TIER_4 = 4 };

enum class TradeStatus { OPEN, CLOSED_SL, CLOSED_TARGET, CLOSED_EXPIRY, CANCELLED };

// Daily OHLC bar, date is ISO "YYYY-MM-DD"
struct DailyBar {
    std::string date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

std::string toString(Direction direction);
std::string toString(ConfidenceLevel level);
std::string toString(Tier tier);
std::string toString(TradeStatus status);

Direction directionFromString(const std::string& value);
ConfidenceLevel confidenceLevelFromString(const std::string& value);
std::optional<Tier> tierFromString(const std::string& value);
TradeStatus tradeStatusFromString(const std::string& value);

bool isTerminal(TradeStatus status);

// 1 -> "BTST_1d", 3 -> "Swing_3d", ...
std::string horizonLabel(int horizon_days);

long long getCurrentTimestampMs();

} // namespace patternedge
