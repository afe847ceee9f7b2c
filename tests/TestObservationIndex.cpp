#include "analytics/ObservationIndex.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace patternedge;
using namespace patternedge::analytics;

namespace {

Observation makeObs(std::vector<std::string> patterns, const std::string& instrument,
                    const std::string& trend, Direction dir5) {
    Observation o;
    o.patterns = std::move(patterns);
    o.instrument = instrument;
    o.sector = "banking";
    o.timeframe = "daily";
    o.trend = trend;
    o.volatility_zone = "normal";
    o.price_position = "mid";
    o.market_regime = "bull|low_vol";
    o.timestamp = "2024-01-02";
    o.close = 100.0;
    HorizonOutcome out;
    out.direction = dir5;
    out.return_pct = dir5 == Direction::BULLISH ? 1.0 : -1.0;
    o.outcomes[5] = out;
    return o;
}

void testLookupAndIntersect() {
    std::vector<Observation> obs{
        makeObs({"hammer"}, "sbin", "bullish", Direction::BULLISH),
        makeObs({"hammer", "morning_star"}, "tcs", "bearish", Direction::BEARISH),
        makeObs({"morning_star"}, "sbin", "bullish", Direction::NEUTRAL),
        makeObs({"hammer"}, "infy", "bullish", Direction::BULLISH)};
    ObservationIndex index(obs, 5);

    assert(index.size() == 4);
    assert(index.at(2).id == 2);

    const auto& hammer = index.lookup(IndexField::PATTERN, "hammer");
    assert((hammer == IdList{0, 1, 3}));
    const auto& bullish = index.lookup(IndexField::TREND, "bullish");
    assert((ObservationIndex::intersect(hammer, bullish) == IdList{0, 3}));

    assert(index.lookup(IndexField::PATTERN, "doji").empty());
    assert(index.lookup(IndexField::INSTRUMENT, "sbin").size() == 2);
    assert(index.lookup(IndexField::BROAD_REGIME, "bull").size() == 4);
    assert(index.lookup(IndexField::MARKET_REGIME, "bull|low_vol").size() == 4);
    assert(index.distinctValues(IndexField::INSTRUMENT) == 3);
    std::cout << "[TEST] ObservationIndex lookup/intersect PASSED" << std::endl;
}

void testDuplicatesAndEmptyValues() {
    auto a = makeObs({"hammer", "hammer"}, "sbin", "", Direction::BULLISH);
    a.sector.clear();
    ObservationIndex index({a}, 5);

    // one id per observation even with a repeated pattern
    assert(index.lookup(IndexField::PATTERN, "hammer").size() == 1);
    // empty fields are not indexed
    assert(index.distinctValues(IndexField::TREND) == 0);
    assert(index.distinctValues(IndexField::SECTOR) == 0);
    std::cout << "[TEST] ObservationIndex duplicates PASSED" << std::endl;
}

void testBaseRates() {
    std::vector<Observation> obs;
    for (int i = 0; i < 6; ++i) obs.push_back(makeObs({"p"}, "sbin", "bullish", Direction::BULLISH));
    for (int i = 0; i < 3; ++i) obs.push_back(makeObs({"p"}, "sbin", "bullish", Direction::BEARISH));
    obs.push_back(makeObs({"p"}, "sbin", "bullish", Direction::NEUTRAL));
    // no primary outcome, excluded from base rates
    auto missing = makeObs({"p"}, "sbin", "bullish", Direction::BULLISH);
    missing.outcomes.clear();
    obs.push_back(missing);

    ObservationIndex index(obs, 5);
    const auto& base = index.baseRates();
    assert(base.count == 10);
    assert(std::abs(base.bullish_pct - 60.0) < 1e-9);
    assert(std::abs(base.bearish_pct - 30.0) < 1e-9);
    assert(std::abs(base.neutral_pct - 10.0) < 1e-9);
    assert(index.primaryHorizon() == 5);
    std::cout << "[TEST] ObservationIndex base rates PASSED" << std::endl;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting ObservationIndex Test..." << std::endl;
    testLookupAndIntersect();
    testDuplicatesAndEmptyValues();
    testBaseRates();
    std::cout << "[TEST] ObservationIndex Test PASSED!" << std::endl;
    return 0;
}
