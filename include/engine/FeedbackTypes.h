#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace patternedge {
namespace engine {

enum class AdjustmentKind {
    PATTERN,
    PATTERN_TREND,
    PATTERN_HORIZON,
    PATTERN_TREND_HORIZON,
    PATTERN_SECTOR
};

// Segment key. Which optional fields are set follows from `kind`.
struct AdjustmentKey {
    AdjustmentKind kind = AdjustmentKind::PATTERN;
    std::string pattern;
    std::optional<std::string> trend;
    std::optional<std::string> horizon;
    std::optional<std::string> sector;

    static AdjustmentKey forPattern(const std::string& pattern);
    static AdjustmentKey forTrend(const std::string& pattern, const std::string& trend);
    static AdjustmentKey forHorizon(const std::string& pattern, const std::string& horizon);
    static AdjustmentKey forTriple(const std::string& pattern, const std::string& trend,
                                   const std::string& horizon);
    static AdjustmentKey forSector(const std::string& pattern, const std::string& sector);

    bool operator<(const AdjustmentKey& other) const;
    bool operator==(const AdjustmentKey& other) const;
    std::string toString() const;
};

std::string toString(AdjustmentKind kind);

struct AdjustmentRecord {
    int total_trades = 0;
    int wins = 0;
    double win_rate = 0.0;
    double decay_weighted_win_rate = 0.0;
    double avg_return = 0.0;
};

struct VolumeBreakdown {
    int confirmed_trades = 0;
    int confirmed_wins = 0;
    int unconfirmed_trades = 0;
    int unconfirmed_wins = 0;

    // Win rates are only reported from 2 trades upward
    std::optional<double> confirmedWinRate() const;
    std::optional<double> unconfirmedWinRate() const;
};

struct FeedbackRule {
    std::string context;        // trend_alignment, volume_confirmation, stop_loss_tuning, volume_per_pattern_<p>
    double confidence = 0.0;
    std::string type;           // prefer | adjust
    std::string description;
};

enum class FilterAction { REJECT, RELAX };

struct FilterAdjustment {
    FilterAction action = FilterAction::REJECT;
    double actual_win_rate = 0.0;
    int trades = 0;
    std::string reason;
};

// Realized trade outcome handed back for learning
struct OutcomeRecord {
    std::string trade_id;
    std::string instrument;
    std::string sector;
    Direction direction = Direction::BULLISH;
    std::vector<std::string> patterns;
    int horizon_days = 0;
    std::string horizon_label;
    std::string trend_at_entry;
    double volume_ratio = 1.0;
    bool won = false;
    double actual_return_pct = 0.0;
    std::string exit_reason;
    bool stop_loss_triggered = false;
    std::string entry_date;
    std::string exit_date;
    double predicted_win_rate = 0.0;
    std::string confidence_level;

    // Throws FeedbackValidationError naming the first missing field
    void validate() const;
};

struct FeedbackSnapshot {
    std::uint64_t version = 0;
    std::string updated_at;     // as-of date of the last rebuild
    std::vector<OutcomeRecord> outcomes;
    std::map<AdjustmentKey, AdjustmentRecord> adjustments;
    std::map<std::string, VolumeBreakdown> volume_breakdown;
    std::vector<FeedbackRule> rules;
    std::map<AdjustmentKey, FilterAdjustment> filters;

    const AdjustmentRecord* find(const AdjustmentKey& key) const;
    const FilterAdjustment* filter(const AdjustmentKey& key) const;
    bool empty() const { return adjustments.empty() && rules.empty(); }
};

} // namespace engine
} // namespace patternedge
