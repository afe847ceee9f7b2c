#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analytics/ObservationIndex.h"
#include "analytics/Prediction.h"
#include "engine/EngineConfig.h"
#include "engine/FeedbackBlender.h"

namespace patternedge {
namespace analytics {

struct Retrieval {
    IdList candidates;                       // capped, most recent first, at most top_k
    Tier tier = Tier::TIER_4;
    std::vector<std::string> dropped_fields; // tier-1 context fields not applied at this tier
};

struct PredictionQuery {
    std::vector<std::string> patterns;
    QueryContext context;
};

// Statistical predictor over historical pattern outcomes.
// Retrieval relaxes context constraints tier by tier until enough capped matches remain.
class TieredPredictor {
public:
    TieredPredictor(
        std::shared_ptr<const ObservationIndex> index,
        engine::PredictorConfig config,
        engine::FeedbackConfig feedback_config = engine::FeedbackConfig{}
    );

    // nullopt when no tier reaches min_matches after capping
    std::optional<Retrieval> retrieve(const std::string& pattern, const QueryContext& context) const;

    // nullopt for untradeable patterns, insufficient data, rejected tiers or missing primary horizon
    std::optional<Prediction> predict(
        const std::string& pattern,
        const QueryContext& context,
        const engine::FeedbackSnapshot* feedback = nullptr
    ) const;

    // Strongest edge across the given patterns
    std::optional<Prediction> predictBest(
        const std::vector<std::string>& patterns,
        const QueryContext& context,
        const engine::FeedbackSnapshot* feedback = nullptr
    ) const;

    std::vector<std::optional<Prediction>> predictBatch(
        const std::vector<PredictionQuery>& queries,
        const engine::FeedbackSnapshot* feedback,
        int workers
    ) const;

    bool isTradeablePattern(const std::string& pattern) const;
    bool isAcceptedTier(Tier tier) const;
    double confidenceScore(double edge_strength_pct, int n_matches, Tier tier, double profit_factor) const;
    ConfidenceLevel confidenceLevel(double score) const;
    double stopLossPct(const std::string& pattern, double atr, double close) const;

    const ObservationIndex& index() const { return *index_; }
    const engine::PredictorConfig& config() const { return config_; }
    const engine::FeedbackBlender& blender() const { return blender_; }

private:
    IdList capPerInstrument(const IdList& ids, const std::string& query_instrument) const;
    IdList capPerSector(const IdList& ids) const;
    std::vector<HorizonStats> horizonStats(const IdList& ids) const;

    std::shared_ptr<const ObservationIndex> index_;
    engine::PredictorConfig config_;
    engine::FeedbackBlender blender_;
};

} // namespace analytics
} // namespace patternedge
