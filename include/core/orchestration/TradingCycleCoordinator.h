#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analytics/Observation.h"
#include "analytics/RegimeDetector.h"
#include "analytics/TieredPredictor.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IMarketDataSource.h"
#include "engine/EngineConfig.h"
#include "engine/FeedbackStore.h"
#include "engine/PerformanceStore.h"
#include "engine/TradeLifecycleEngine.h"
#include "risk/PositionSizer.h"
#include "risk/RiskManager.h"

namespace patternedge {
namespace core {

// Per-horizon levels derived from a prediction
struct HorizonPlan {
    int horizon_days = 0;
    std::string horizon_label;
    Direction direction = Direction::NEUTRAL;
    double sl_pct = 0.0;
    double target_pct = 0.0;
    double rr_ratio = 0.0;
};

struct ScanDecision {
    std::string instrument;
    std::string pattern;
    HorizonPlan plan;
    double win_rate = 0.0;
    ConfidenceLevel confidence_level = ConfidenceLevel::LOW;
    risk::SizingResult sizing;
    bool accepted = false;
    std::string trade_id;
    std::vector<std::string> reasons;
    // Rejected but followed as a shadow trade
    bool shadow = false;
};

struct SessionReport {
    std::string date;
    int reconciled = 0;
    int catch_up_days = 0;
    bool scanned = false;
    int observations = 0;
    int signals = 0;
    int accepted = 0;
    int rejected = 0;
    int duplicates = 0;
    int filled = 0;
    int cancelled = 0;
    int closed = 0;
    int outcomes_ingested = 0;
    int shadows_tracked = 0;
    int shadows_closed = 0;
    std::string regime;
    engine::DailySummary daily;
};

// One batch session: reconcile -> catch-up -> scan -> monitor -> feedback
class TradingCycleCoordinator {
public:
    TradingCycleCoordinator(
        engine::EngineConfig config,
        std::shared_ptr<const analytics::TieredPredictor> predictor,
        std::shared_ptr<engine::FeedbackStore> feedback,
        std::shared_ptr<const analytics::RegimeDetector> regime,
        std::shared_ptr<risk::RiskManager> risk,
        std::shared_ptr<engine::TradeLifecycleEngine> lifecycle,
        std::shared_ptr<const IMarketDataSource> market_data,
        std::shared_ptr<IEventJournal> journal = nullptr
    );

    SessionReport runSession(const std::string& date, const std::vector<analytics::Observation>& live);

    int reconcile();

    // Monitors every trading day after the last scan and before date
    int catchUp(const std::string& date);

    // dry_run evaluates and sizes without opening trades or marking the date scanned
    std::vector<ScanDecision> scan(const std::string& date,
                                   const std::vector<analytics::Observation>& live,
                                   bool dry_run = false);

    engine::MonitorReport monitor(const std::string& date);

    // Drains closed-trade outcomes into the feedback store, rebuilds and saves it
    int flushFeedback(const std::string& date);

    std::vector<HorizonPlan> planHorizons(const analytics::Prediction& prediction,
                                          const analytics::Observation& observation) const;

private:
    struct ShadowCandidate {
        engine::TradeSignal signal;
        std::vector<std::string> reasons;
        std::size_t decision_index = 0;
    };

    std::vector<ScanDecision> evaluate(const std::string& date,
                                       const analytics::Observation& observation,
                                       const analytics::Prediction& prediction,
                                       const engine::FeedbackSnapshot* feedback,
                                       bool dry_run,
                                       std::vector<ShadowCandidate>* shadows);
    // Follows an evenly spaced shadow_sample_pct share of the candidates
    void trackShadows(const std::vector<ShadowCandidate>& candidates, std::vector<ScanDecision>& decisions);
    void journal(JournalEventType type, const std::string& instrument,
                 const std::string& entity_id, nlohmann::json payload);

    engine::EngineConfig config_;
    std::shared_ptr<const analytics::TieredPredictor> predictor_;
    std::shared_ptr<engine::FeedbackStore> feedback_;
    std::shared_ptr<const analytics::RegimeDetector> regime_;
    std::shared_ptr<risk::RiskManager> risk_;
    std::shared_ptr<engine::TradeLifecycleEngine> lifecycle_;
    std::shared_ptr<const IMarketDataSource> market_data_;
    std::shared_ptr<IEventJournal> journal_;
    risk::PositionSizer sizer_;
};

} // namespace core
} // namespace patternedge
