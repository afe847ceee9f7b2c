#include "engine/FeedbackTypes.h"
#include "common/Errors.h"

#include <tuple>

namespace patternedge {
namespace engine {

AdjustmentKey AdjustmentKey::forPattern(const std::string& pattern) {
    AdjustmentKey key;
    key.kind = AdjustmentKind::PATTERN;
    key.pattern = pattern;
    return key;
}

AdjustmentKey AdjustmentKey::forTrend(const std::string& pattern, const std::string& trend) {
    AdjustmentKey key = forPattern(pattern);
    key.kind = AdjustmentKind::PATTERN_TREND;
    key.trend = trend;
    return key;
}

AdjustmentKey AdjustmentKey::forHorizon(const std::string& pattern, const std::string& horizon) {
    AdjustmentKey key = forPattern(pattern);
    key.kind = AdjustmentKind::PATTERN_HORIZON;
    key.horizon = horizon;
    return key;
}

AdjustmentKey AdjustmentKey::forTriple(const std::string& pattern, const std::string& trend,
                                       const std::string& horizon) {
    AdjustmentKey key = forPattern(pattern);
    key.kind = AdjustmentKind::PATTERN_TREND_HORIZON;
    key.trend = trend;
    key.horizon = horizon;
    return key;
}

AdjustmentKey AdjustmentKey::forSector(const std::string& pattern, const std::string& sector) {
    AdjustmentKey key = forPattern(pattern);
    key.kind = AdjustmentKind::PATTERN_SECTOR;
    key.sector = sector;
    return key;
}

bool AdjustmentKey::operator<(const AdjustmentKey& other) const {
    return std::tie(kind, pattern, trend, horizon, sector) <
           std::tie(other.kind, other.pattern, other.trend, other.horizon, other.sector);
}

bool AdjustmentKey::operator==(const AdjustmentKey& other) const {
    return std::tie(kind, pattern, trend, horizon, sector) ==
           std::tie(other.kind, other.pattern, other.trend, other.horizon, other.sector);
}

std::string AdjustmentKey::toString() const {
    std::string out = engine::toString(kind) + ":" + pattern;
    if (trend) out += "/" + *trend;
    if (horizon) out += "/" + *horizon;
    if (sector) out += "/" + *sector;
    return out;
}

std::string toString(AdjustmentKind kind) {
    switch (kind) {
        case AdjustmentKind::PATTERN: return "pattern";
        case AdjustmentKind::PATTERN_TREND: return "regime";
        case AdjustmentKind::PATTERN_HORIZON: return "horizon";
        case AdjustmentKind::PATTERN_TREND_HORIZON: return "triple";
        case AdjustmentKind::PATTERN_SECTOR: return "sector";
    }
    return "pattern";
}

std::optional<double> VolumeBreakdown::confirmedWinRate() const {
    if (confirmed_trades < 2) {
        return std::nullopt;
    }
    return static_cast<double>(confirmed_wins) / confirmed_trades * 100.0;
}

std::optional<double> VolumeBreakdown::unconfirmedWinRate() const {
    if (unconfirmed_trades < 2) {
        return std::nullopt;
    }
    return static_cast<double>(unconfirmed_wins) / unconfirmed_trades * 100.0;
}

void OutcomeRecord::validate() const {
    auto fail = [this](const std::string& field) {
        throw FeedbackValidationError(
            "outcome '" + trade_id + "' is missing required field: " + field);
    };
    if (trade_id.empty()) fail("trade_id");
    if (patterns.empty()) fail("patterns");
    for (const auto& p : patterns) {
        if (p.empty()) fail("patterns");
    }
    if (horizon_days <= 0) fail("horizon_days");
    if (horizon_label.empty()) fail("horizon_label");
    if (trend_at_entry.empty()) fail("trend_at_entry");
    if (sector.empty()) fail("sector");
    if (exit_date.empty()) fail("exit_date");
    if (direction == Direction::NEUTRAL) fail("direction");
}

const AdjustmentRecord* FeedbackSnapshot::find(const AdjustmentKey& key) const {
    const auto it = adjustments.find(key);
    return it == adjustments.end() ? nullptr : &it->second;
}

const FilterAdjustment* FeedbackSnapshot::filter(const AdjustmentKey& key) const {
    const auto it = filters.find(key);
    return it == filters.end() ? nullptr : &it->second;
}

} // namespace engine
} // namespace patternedge
