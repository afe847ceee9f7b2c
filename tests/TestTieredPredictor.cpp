#include "analytics/TieredPredictor.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <map>
#include <memory>
#include <set>

using namespace patternedge;
using namespace patternedge::analytics;

namespace {

const char* kSectors[] = {"banking", "it", "energy", "pharma"};

Observation makeObs(const std::string& pattern, const std::string& instrument, const std::string& sector,
                    bool bullish, int day, const std::string& trend = "bullish",
                    const std::string& zone = "normal") {
    Observation o;
    o.patterns = {pattern};
    o.instrument = instrument;
    o.sector = sector;
    o.timeframe = "daily";
    o.trend = trend;
    o.volatility_zone = zone;
    o.price_position = "mid";
    o.market_regime = "bull|low_vol";
    char ts[32];
    std::snprintf(ts, sizeof(ts), "2023-%02d-%02d", 1 + (day / 28) % 12, 1 + day % 28);
    o.timestamp = ts;
    o.close = 100.0;
    o.atr = 1.0;
    HorizonOutcome out;
    out.direction = bullish ? Direction::BULLISH : Direction::BEARISH;
    out.return_pct = bullish ? 2.0 : -1.0;
    out.mfe_pct = bullish ? 2.5 : 0.5;
    out.mae_pct = bullish ? -0.5 : -1.2;
    o.outcomes[5] = out;
    return o;
}

QueryContext fullContext() {
    QueryContext ctx;
    ctx.timeframe = "daily";
    ctx.trend = "bullish";
    ctx.volatility_zone = "normal";
    ctx.price_position = "mid";
    return ctx;
}

// 40 bullish_engulfing rows at 60% bullish over 10 instruments and 4 sectors,
// plus 60 filler rows so the dataset base rate is exactly 50%.
std::vector<Observation> scenarioDataset() {
    std::vector<Observation> obs;
    for (int i = 0; i < 40; ++i) {
        const std::string instrument = "stock" + std::to_string(i % 10);
        obs.push_back(makeObs("bullish_engulfing", instrument, kSectors[i % 4], i < 24, i));
    }
    for (int i = 0; i < 60; ++i) {
        const std::string instrument = "filler" + std::to_string(i % 20);
        obs.push_back(makeObs("spinning_top", instrument, kSectors[i % 4], i < 26, i));
    }
    return obs;
}

void testScenarioEdge() {
    auto index = std::make_shared<ObservationIndex>(scenarioDataset(), 5);
    assert(std::abs(index->baseRates().bullish_pct - 50.0) < 1e-9);

    TieredPredictor predictor(index, engine::PredictorConfig{});
    const auto p = predictor.predict("bullish_engulfing", fullContext());
    assert(p.has_value());
    assert(p->tier == Tier::TIER_1);
    assert(p->dropped_fields.empty());
    assert(p->n_matches == 40);
    assert(std::abs(p->bullish_edge - 10.0) < 1e-9);
    assert(std::abs(p->edgeStrength() - 10.0) < 1e-9);
    assert(p->direction == Direction::BULLISH);
    assert(std::abs(p->win_rate - 60.0) < 1e-9);
    assert(std::abs(p->profit_factor - 3.0) < 1e-9);
    assert(p->confidence_level != ConfidenceLevel::LOW);
    assert(p->instrument_diversity == 10);
    assert(p->horizon(5) != nullptr);
    assert(p->horizon(10) == nullptr);
    std::cout << "[TEST] Predictor scenario edge=10 PASSED" << std::endl;
}

void testScenarioInsufficient() {
    auto obs = scenarioDataset();
    obs.push_back(makeObs("abandoned_baby", "stock1", "it", true, 1));
    obs.push_back(makeObs("abandoned_baby", "stock2", "it", true, 2));
    auto index = std::make_shared<ObservationIndex>(obs, 5);
    TieredPredictor predictor(index, engine::PredictorConfig{});

    assert(!predictor.retrieve("abandoned_baby", fullContext()).has_value());
    assert(!predictor.predict("abandoned_baby", fullContext()).has_value());
    assert(!predictor.predict("never_seen", fullContext()).has_value());
    std::cout << "[TEST] Predictor insufficient data PASSED" << std::endl;
}

void testCaps() {
    std::vector<Observation> obs;
    // one instrument, 20 rows
    for (int i = 0; i < 20; ++i) {
        obs.push_back(makeObs("morning_star", "sbin", "banking", i % 2 == 0, i));
    }
    // ten banking names, 3 rows each
    for (int i = 0; i < 30; ++i) {
        obs.push_back(makeObs("piercing_line", "bank" + std::to_string(i % 10), "banking", i % 3 != 0, i));
    }
    auto index = std::make_shared<ObservationIndex>(obs, 5);
    TieredPredictor predictor(index, engine::PredictorConfig{});

    const auto single = predictor.retrieve("morning_star", fullContext());
    assert(single.has_value());
    assert(single->candidates.size() == 5);

    // the queried instrument only keeps max(3, n/5) of its own history
    auto own = fullContext();
    own.instrument = "sbin";
    assert(!predictor.retrieve("morning_star", own).has_value());

    const auto sector = predictor.retrieve("piercing_line", fullContext());
    assert(sector.has_value());
    assert(sector->candidates.size() == 15);
    std::map<std::string, int> per_instrument;
    for (auto id : sector->candidates) {
        per_instrument[index->at(id).instrument]++;
    }
    for (const auto& kv : per_instrument) {
        assert(kv.second <= 5);
    }
    // most recent first
    for (std::size_t i = 1; i < sector->candidates.size(); ++i) {
        assert(index->at(sector->candidates[i - 1]).timestamp >= index->at(sector->candidates[i]).timestamp);
    }
    std::cout << "[TEST] Predictor caps PASSED" << std::endl;
}

void testTierCascade() {
    std::vector<Observation> obs;
    // matches timeframe+trend but never the volatility zone
    for (int i = 0; i < 12; ++i) {
        obs.push_back(makeObs("three_white_soldiers", "stock" + std::to_string(i), kSectors[i % 4],
                              i % 4 != 0, i, "bullish", "high"));
    }
    // matches timeframe only
    for (int i = 0; i < 12; ++i) {
        obs.push_back(makeObs("rising_window", "stock" + std::to_string(i), kSectors[i % 4],
                              i % 4 != 0, i, "bearish", "high"));
    }
    auto index = std::make_shared<ObservationIndex>(obs, 5);
    TieredPredictor predictor(index, engine::PredictorConfig{});

    const auto t2 = predictor.retrieve("three_white_soldiers", fullContext());
    assert(t2.has_value());
    assert(t2->tier == Tier::TIER_2);
    assert((t2->dropped_fields == std::vector<std::string>{"volatility_zone", "price_position"}));

    const auto t3 = predictor.retrieve("rising_window", fullContext());
    assert(t3.has_value());
    assert(t3->tier == Tier::TIER_3);
    assert(t3->dropped_fields.size() == 3);
    // tier 3 is not accepted by default
    assert(!predictor.predict("rising_window", fullContext()).has_value());

    engine::PredictorConfig loose;
    loose.accepted_tiers = {Tier::TIER_1, Tier::TIER_2, Tier::TIER_3};
    TieredPredictor permissive(index, loose);
    const auto p = permissive.predict("rising_window", fullContext());
    assert(p.has_value());
    assert(p->tier == Tier::TIER_3);
    std::cout << "[TEST] Predictor tier cascade PASSED" << std::endl;
}

void testTradeablePatterns() {
    auto obs = scenarioDataset();
    for (int i = 0; i < 10; ++i) {
        obs.push_back(makeObs("doji", "stock" + std::to_string(i), kSectors[i % 4], true, i));
    }
    auto index = std::make_shared<ObservationIndex>(obs, 5);
    TieredPredictor predictor(index, engine::PredictorConfig{});
    assert(!predictor.isTradeablePattern("doji"));
    assert(predictor.isTradeablePattern("bullish_engulfing"));
    assert(!predictor.predict("doji", fullContext()).has_value());

    // predictBest skips the excluded pattern and keeps the tradeable one
    const auto best = predictor.predictBest({"doji", "bullish_engulfing"}, fullContext());
    assert(best.has_value());
    assert(best->pattern == "bullish_engulfing");

    engine::PredictorConfig whitelist;
    whitelist.allowed_patterns = {"spinning_top"};
    TieredPredictor restricted(index, whitelist);
    assert(!restricted.isTradeablePattern("bullish_engulfing"));
    assert(restricted.isTradeablePattern("spinning_top"));
    std::cout << "[TEST] Predictor tradeable patterns PASSED" << std::endl;
}

void testConfidenceBounds() {
    auto index = std::make_shared<ObservationIndex>(scenarioDataset(), 5);
    TieredPredictor predictor(index, engine::PredictorConfig{});

    const double hi = predictor.confidenceScore(500.0, 1000, Tier::TIER_1, 100.0);
    const double lo = predictor.confidenceScore(-80.0, 0, Tier::TIER_4, 0.0);
    assert(hi >= 0.0 && hi <= 1.0);
    assert(lo >= 0.0 && lo <= 1.0);
    assert(std::abs(hi - 1.0) < 1e-9);
    assert(lo == 0.0);

    // 0.10*0.30 + 1.0*0.20 + 1.0*0.25 + 1.0*0.25
    assert(std::abs(predictor.confidenceScore(10.0, 40, Tier::TIER_1, 3.0) - 0.73) < 1e-9);

    assert(predictor.confidenceLevel(0.56) == ConfidenceLevel::HIGH);
    assert(predictor.confidenceLevel(0.55) == ConfidenceLevel::MEDIUM);
    assert(predictor.confidenceLevel(0.36) == ConfidenceLevel::MEDIUM);
    assert(predictor.confidenceLevel(0.35) == ConfidenceLevel::LOW);
    std::cout << "[TEST] Predictor confidence bounds PASSED" << std::endl;
}

void testStopLossAndBatch() {
    auto index = std::make_shared<ObservationIndex>(scenarioDataset(), 5);
    TieredPredictor predictor(index, engine::PredictorConfig{});

    // 1.5 * 1 / 100 * 100 = 1.5 ; structural 2.0
    assert(std::abs(predictor.stopLossPct("bullish_engulfing", 1.0, 100.0) - 1.5) < 1e-9);
    assert(std::abs(predictor.stopLossPct("bullish_kicker", 1.0, 100.0) - 2.0) < 1e-9);
    assert(std::abs(predictor.stopLossPct("bullish_engulfing", 0.01, 100.0) - 0.3) < 1e-9);
    assert(std::abs(predictor.stopLossPct("bullish_engulfing", 50.0, 100.0) - 5.0) < 1e-9);

    std::vector<PredictionQuery> queries(6);
    for (std::size_t i = 0; i < queries.size(); ++i) {
        queries[i].patterns = {i % 2 == 0 ? "bullish_engulfing" : "unknown_pattern"};
        queries[i].context = fullContext();
    }
    const auto results = predictor.predictBatch(queries, nullptr, 3);
    assert(results.size() == 6);
    for (std::size_t i = 0; i < results.size(); ++i) {
        assert(results[i].has_value() == (i % 2 == 0));
    }
    std::cout << "[TEST] Predictor stop loss/batch PASSED" << std::endl;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting TieredPredictor Test..." << std::endl;
    testScenarioEdge();
    testScenarioInsufficient();
    testCaps();
    testTierCascade();
    testTradeablePatterns();
    testConfidenceBounds();
    testStopLossAndBatch();
    std::cout << "[TEST] TieredPredictor Test PASSED!" << std::endl;
    return 0;
}
