#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace patternedge {
namespace analytics {

struct HorizonStats {
    int horizon = 0;
    int count = 0;
    Direction direction = Direction::NEUTRAL;
    double bullish_pct = 0.0;
    double bearish_pct = 0.0;
    double bullish_edge = 0.0;
    double bearish_edge = 0.0;
    double avg_return = 0.0;
    double median_return = 0.0;
    double std_return = 0.0;
    double min_return = 0.0;
    double max_return = 0.0;
};

// Present when a feedback snapshot was consulted
struct FeedbackTrace {
    bool applied = false;          // win rate was blended
    std::string source;            // e.g. "triple:bullish_engulfing/bullish/Swing_5d"
    double weight = 0.0;
    double paper_win_rate = 0.0;
    int paper_trades = 0;
    double confidence_boost = 0.0;
};

struct Prediction {
    std::string pattern;
    Tier tier = Tier::TIER_4;
    std::vector<std::string> dropped_fields;
    int n_matches = 0;
    int instrument_diversity = 0;
    std::vector<HorizonStats> horizons;

    // Primary horizon
    int primary_horizon = 5;
    Direction direction = Direction::NEUTRAL;
    double bullish_edge = 0.0;
    double bearish_edge = 0.0;
    double avg_return = 0.0;
    double median_return = 0.0;

    // Simulated trades in the predicted direction
    double win_rate = 0.0;
    double profit_factor = 0.0;
    double sl_pct = 0.0;
    double sl_win_rate = 0.0;
    double sl_profit_factor = 0.0;
    double sl_trigger_pct = 0.0;
    double avg_mfe = 0.0;
    double avg_mae = 0.0;
    double rr_ratio = 0.0;

    double confidence = 0.0;
    ConfidenceLevel confidence_level = ConfidenceLevel::LOW;

    // Pre-blend values kept for A/B comparison
    double raw_win_rate = 0.0;
    double raw_confidence = 0.0;
    FeedbackTrace feedback;

    // max(|bullish_edge|, |bearish_edge|) in percentage points
    double edgeStrength() const;
    const HorizonStats* horizon(int days) const;
};

} // namespace analytics
} // namespace patternedge
