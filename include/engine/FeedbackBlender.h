#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/Prediction.h"
#include "engine/EngineConfig.h"
#include "engine/FeedbackTypes.h"

namespace patternedge {
namespace engine {

struct BlendQuery {
    std::string pattern;
    std::string trend;
    std::string horizon_label;
    std::string sector;
};

struct BlendSource {
    AdjustmentKey key;
    AdjustmentRecord record;
};

// Folds paper-trading results into a raw prediction.
// Win rate: most specific qualifying segment wins, weighted by min(cap, n / (n + prior)).
// Confidence: signed rule adjustments, clamped to [0, 1].
class FeedbackBlender {
public:
    FeedbackBlender(FeedbackConfig config, PredictorConfig predictor_config);

    analytics::Prediction blend(
        const analytics::Prediction& raw,
        const FeedbackSnapshot& snapshot,
        const BlendQuery& query
    ) const;

    std::optional<BlendSource> selectSource(const FeedbackSnapshot& snapshot, const BlendQuery& query) const;

    // Horizon specific paper win rate (triple, then pattern+horizon) for the first pattern that has one
    std::optional<double> horizonWinRate(
        const FeedbackSnapshot& snapshot,
        const std::vector<std::string>& patterns,
        const std::string& trend,
        const std::string& horizon_label
    ) const;

    double blendWeight(int trades) const;
    double ruleConfidenceBoost(
        const FeedbackSnapshot& snapshot,
        const BlendQuery& query,
        Direction direction
    ) const;

private:
    FeedbackConfig config_;
    PredictorConfig predictor_config_;
};

} // namespace engine
} // namespace patternedge
