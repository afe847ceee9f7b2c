#include "engine/FeedbackBlender.h"
#include "engine/FeedbackStore.h"
#include "core/state/FeedbackStateStoreJson.h"
#include "common/Errors.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <thread>

using namespace patternedge;
using namespace patternedge::engine;

namespace {

// Same optimistic version contract as the JSON store, kept in memory
class MemoryFeedbackStore : public core::IFeedbackStateStore {
public:
    std::optional<FeedbackSnapshot> load() override { return stored; }

    bool save(const FeedbackSnapshot& snapshot, std::uint64_t expected_version) override {
        const std::uint64_t on_disk = stored ? stored->version : 0;
        if (on_disk != expected_version) {
            throw VersionConflictError("stale feedback version");
        }
        stored = snapshot;
        ++saves;
        return true;
    }

    std::optional<FeedbackSnapshot> stored;
    int saves = 0;
};

OutcomeRecord outcome(const std::string& id, const std::string& pattern, const std::string& trend,
                      Direction dir, bool won, bool stopped = false) {
    OutcomeRecord o;
    o.trade_id = id;
    o.instrument = "sbin";
    o.sector = "banking";
    o.direction = dir;
    o.patterns = {pattern};
    o.horizon_days = 5;
    o.horizon_label = "Swing_5d";
    o.trend_at_entry = trend;
    o.volume_ratio = 1.0;
    o.won = won;
    o.actual_return_pct = won ? 2.0 : -1.5;
    o.exit_reason = won ? "target_hit" : (stopped ? "sl_hit" : "expired");
    o.stop_loss_triggered = stopped;
    o.entry_date = "2024-02-23";
    o.exit_date = "2024-03-01";
    o.predicted_win_rate = 60.0;
    o.confidence_level = "MEDIUM";
    return o;
}

std::vector<OutcomeRecord> mixedOutcomes() {
    std::vector<OutcomeRecord> out;
    int n = 0;
    auto id = [&n]() { return "PT" + std::to_string(++n); };
    // hammer: 5/6 aligned wins, 0/4 counter-trend, losses stopped out
    for (int i = 0; i < 6; ++i) out.push_back(outcome(id(), "hammer", "bullish", Direction::BULLISH, i < 5, i >= 5));
    for (int i = 0; i < 4; ++i) out.push_back(outcome(id(), "hammer", "bearish", Direction::BULLISH, false, true));
    // shooting_star: 1/5
    for (int i = 0; i < 5; ++i) out.push_back(outcome(id(), "shooting_star", "bearish", Direction::BEARISH, i == 0, i != 0));
    // morning_star: 8/10
    for (int i = 0; i < 10; ++i) out.push_back(outcome(id(), "morning_star", "bullish", Direction::BULLISH, i < 8, i >= 8));
    return out;
}

analytics::Prediction rawPrediction(double win_rate) {
    analytics::Prediction p;
    p.pattern = "hammer";
    p.direction = Direction::BULLISH;
    p.win_rate = win_rate;
    p.confidence = 0.40;
    p.confidence_level = ConfidenceLevel::MEDIUM;
    return p;
}

void testBlendWeight() {
    FeedbackBlender blender(FeedbackConfig{}, PredictorConfig{});
    assert(blender.blendWeight(0) == 0.0);
    double prev = 0.0;
    for (int n = 1; n <= 200; ++n) {
        const double w = blender.blendWeight(n);
        assert(w >= prev);
        assert(w <= 0.50);
        prev = w;
    }
    assert(std::abs(blender.blendWeight(20) - 0.5) < 1e-12);
    assert(std::abs(blender.blendWeight(3) - 3.0 / 23.0) < 1e-12);
    std::cout << "[TEST] Feedback blend weight PASSED" << std::endl;
}

void testScenarioTripleBlend() {
    FeedbackBlender blender(FeedbackConfig{}, PredictorConfig{});
    FeedbackSnapshot snap;
    AdjustmentRecord triple;
    triple.total_trades = 3;
    triple.wins = 2;
    triple.win_rate = 65.0;
    triple.decay_weighted_win_rate = 65.0;
    snap.adjustments[AdjustmentKey::forTriple("hammer", "bullish", "Swing_5d")] = triple;

    BlendQuery q{"hammer", "bullish", "Swing_5d", "banking"};
    const auto out = blender.blend(rawPrediction(50.0), snap, q);
    const double w = 3.0 / 23.0;
    assert(std::abs(w - 0.1304) < 1e-4);
    assert(out.feedback.applied);
    assert(std::abs(out.feedback.weight - w) < 1e-12);
    assert(std::abs(out.win_rate - (50.0 + 15.0 * w)) < 1e-9);
    assert(out.win_rate > 50.0 && out.win_rate < 65.0);
    assert(std::abs(out.raw_win_rate - 50.0) < 1e-12);
    // no rules, confidence untouched
    assert(std::abs(out.confidence - 0.40) < 1e-12);
    std::cout << "[TEST] Feedback triple blend scenario PASSED" << std::endl;
}

void testCascade() {
    FeedbackBlender blender(FeedbackConfig{}, PredictorConfig{});
    FeedbackSnapshot snap;
    AdjustmentRecord small;
    small.total_trades = 2;
    small.win_rate = small.decay_weighted_win_rate = 100.0;
    AdjustmentRecord horizon;
    horizon.total_trades = 4;
    horizon.win_rate = horizon.decay_weighted_win_rate = 75.0;
    AdjustmentRecord pattern;
    pattern.total_trades = 30;
    pattern.win_rate = 40.0;
    pattern.decay_weighted_win_rate = 42.0;

    // triple below its minimum of 3 falls through to pattern+horizon
    snap.adjustments[AdjustmentKey::forTriple("hammer", "bullish", "Swing_5d")] = small;
    snap.adjustments[AdjustmentKey::forHorizon("hammer", "Swing_5d")] = horizon;
    snap.adjustments[AdjustmentKey::forPattern("hammer")] = pattern;

    BlendQuery q{"hammer", "bullish", "Swing_5d", "banking"};
    auto src = blender.selectSource(snap, q);
    assert(src.has_value());
    assert(src->key == AdjustmentKey::forHorizon("hammer", "Swing_5d"));

    BlendQuery other_horizon{"hammer", "bullish", "Swing_10d", "banking"};
    src = blender.selectSource(snap, other_horizon);
    assert(src.has_value());
    assert(src->key.kind == AdjustmentKind::PATTERN);
    // decay weighted rate is what gets blended
    const auto out = blender.blend(rawPrediction(60.0), snap, other_horizon);
    assert(std::abs(out.win_rate - (60.0 * 0.5 + 42.0 * 0.5)) < 1e-9);

    assert(!blender.selectSource(snap, BlendQuery{"doji", "bullish", "Swing_5d", ""}).has_value());

    const auto hz = blender.horizonWinRate(snap, {"doji", "hammer"}, "bullish", "Swing_5d");
    assert(hz.has_value() && std::abs(*hz - 75.0) < 1e-12);
    assert(!blender.horizonWinRate(snap, {"hammer"}, "bullish", "Swing_25d").has_value());
    std::cout << "[TEST] Feedback cascade PASSED" << std::endl;
}

void testRuleBoost() {
    FeedbackBlender blender(FeedbackConfig{}, PredictorConfig{});
    FeedbackSnapshot snap;
    snap.rules.push_back(FeedbackRule{"trend_alignment", 0.5, "prefer", ""});

    BlendQuery aligned{"hammer", "bullish", "Swing_5d", ""};
    BlendQuery counter{"hammer", "bearish", "Swing_5d", ""};
    // 0.05 * min(3, 1 + 0.5*2.5) * 0.5
    assert(std::abs(blender.ruleConfidenceBoost(snap, aligned, Direction::BULLISH) - 0.05625) < 1e-12);
    assert(std::abs(blender.ruleConfidenceBoost(snap, counter, Direction::BULLISH) + 0.045) < 1e-12);

    snap.rules.push_back(FeedbackRule{"stop_loss_tuning", 1.0, "adjust", ""});
    const auto out = blender.blend(rawPrediction(50.0), snap, counter);
    assert(out.confidence >= 0.0 && out.confidence <= 1.0);
    assert(out.confidence < 0.40);
    assert(!out.feedback.applied);
    std::cout << "[TEST] Feedback rule boost PASSED" << std::endl;
}

void testRebuild() {
    const FeedbackConfig cfg;
    const auto snap = FeedbackStore::build(mixedOutcomes(), "2024-03-10", cfg);

    auto hasRule = [&snap](const std::string& context) {
        return std::any_of(snap.rules.begin(), snap.rules.end(),
                           [&context](const FeedbackRule& r) { return r.context == context; });
    };
    assert(hasRule("trend_alignment"));
    assert(hasRule("stop_loss_tuning"));
    assert(!hasRule("volume_confirmation"));

    const auto* counter = snap.find(AdjustmentKey::forTriple("hammer", "bearish", "Swing_5d"));
    assert(counter && counter->total_trades == 4 && counter->wins == 0);
    const auto* hammer = snap.find(AdjustmentKey::forPattern("hammer"));
    assert(hammer && hammer->total_trades == 10 && std::abs(hammer->win_rate - 50.0) < 1e-9);
    // equal ages, decay weighting does not change the rate
    assert(std::abs(hammer->decay_weighted_win_rate - 50.0) < 1e-9);
    assert(snap.volume_breakdown.at("hammer").unconfirmed_trades == 10);

    const auto* reject = snap.filter(AdjustmentKey::forPattern("shooting_star"));
    assert(reject && reject->action == FilterAction::REJECT && reject->trades == 5);
    const auto* hz_reject = snap.filter(AdjustmentKey::forHorizon("shooting_star", "Swing_5d"));
    assert(hz_reject && hz_reject->action == FilterAction::REJECT);
    const auto* sec_reject = snap.filter(AdjustmentKey::forSector("shooting_star", "banking"));
    assert(sec_reject && sec_reject->action == FilterAction::REJECT);
    const auto* relax = snap.filter(AdjustmentKey::forPattern("morning_star"));
    assert(relax && relax->action == FilterAction::RELAX);
    assert(snap.filter(AdjustmentKey::forPattern("hammer")) == nullptr);

    // too few outcomes, nothing derived
    const auto all = mixedOutcomes();
    std::vector<OutcomeRecord> two(all.begin(), all.begin() + 2);
    const auto sparse = FeedbackStore::build(two, "2024-03-10", cfg);
    assert(sparse.outcomes.size() == 2);
    assert(sparse.adjustments.empty() && sparse.rules.empty() && sparse.filters.empty());
    std::cout << "[TEST] Feedback rebuild PASSED" << std::endl;
}

void testDecay() {
    const FeedbackConfig cfg;
    assert(std::abs(FeedbackStore::decayWeight("2024-03-10", "2024-03-10", cfg) - 1.0) < 1e-12);
    assert(std::abs(FeedbackStore::decayWeight("2024-01-10", "2024-03-10", cfg) - 0.5) < 1e-12);
    assert(std::abs(FeedbackStore::decayWeight("not-a-date", "2024-03-10", cfg) - 0.5) < 1e-12);
    std::cout << "[TEST] Feedback decay PASSED" << std::endl;
}

void testIngestValidationAndDedup() {
    auto backend = std::make_shared<MemoryFeedbackStore>();
    FeedbackStore store(FeedbackConfig{}, backend);
    store.load();

    auto batch = mixedOutcomes();
    assert(store.ingest(batch, "2024-03-10") == static_cast<int>(batch.size()));
    assert(store.ingest(batch, "2024-03-10") == 0);

    auto bad = outcome("PT999", "hammer", "", Direction::BULLISH, true);
    const auto before = store.snapshot();
    bool threw = false;
    try {
        store.ingest({outcome("PT998", "hammer", "bullish", Direction::BULLISH, true), bad}, "2024-03-10");
    } catch (const FeedbackValidationError& e) {
        threw = std::string(e.what()).find("trend_at_entry") != std::string::npos;
    }
    assert(threw);
    // whole batch rejected
    assert(store.snapshot() == before);
    assert(store.snapshot()->outcomes.size() == batch.size());
    std::cout << "[TEST] Feedback ingest validation PASSED" << std::endl;
}

void testConcurrentIngest() {
    FeedbackStore store(FeedbackConfig{}, nullptr);
    constexpr int kWriters = 4;
    constexpr int kBatches = 25;

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&store, w]() {
            for (int b = 0; b < kBatches; ++b) {
                const std::string id = "W" + std::to_string(w) + "-" + std::to_string(b);
                store.ingest({outcome(id, "hammer", "bullish", Direction::BULLISH, b % 2 == 0)}, "2024-03-10");
                if (b % 10 == 0) {
                    store.rebuild("2024-03-10");
                }
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }

    // every batch lands even when writers overlap
    const auto snap = store.snapshot();
    assert(snap->outcomes.size() == static_cast<std::size_t>(kWriters * kBatches));
    std::set<std::string> ids;
    for (const auto& o : snap->outcomes) {
        ids.insert(o.trade_id);
    }
    assert(ids.size() == snap->outcomes.size());
    assert(store.ingest({outcome("W0-0", "hammer", "bullish", Direction::BULLISH, true)}, "2024-03-10") == 0);
    std::cout << "[TEST] Feedback concurrent ingest PASSED" << std::endl;
}

void testVersionConflict() {
    auto backend = std::make_shared<MemoryFeedbackStore>();
    FeedbackStore writer(FeedbackConfig{}, backend);
    FeedbackStore other(FeedbackConfig{}, backend);
    writer.load();
    other.load();

    auto batch = mixedOutcomes();
    writer.ingest({batch.begin(), batch.begin() + 10}, "2024-03-10");
    assert(writer.save());
    assert(writer.persistedVersion() == 1);
    assert(writer.snapshot()->version == 1);

    other.ingest({batch.begin() + 10, batch.end()}, "2024-03-10");
    bool conflict = false;
    try {
        other.save();
    } catch (const VersionConflictError&) {
        conflict = true;
    }
    assert(conflict);
    assert(backend->stored->outcomes.size() == 10);

    // reload then re-apply
    other.load();
    other.ingest({batch.begin() + 10, batch.end()}, "2024-03-10");
    assert(other.save());
    assert(backend->stored->version == 2);
    assert(backend->stored->outcomes.size() == batch.size());
    std::cout << "[TEST] Feedback version conflict PASSED" << std::endl;
}

void testStaleness() {
    auto backend = std::make_shared<MemoryFeedbackStore>();
    FeedbackStore store(FeedbackConfig{}, backend);
    assert(store.usableSnapshot("2024-03-10") == nullptr);

    store.ingest(mixedOutcomes(), "2024-03-10");
    assert(store.usableSnapshot("2024-03-20") != nullptr);
    assert(!store.isStale("2024-04-09"));
    assert(store.isStale("2024-04-10"));
    assert(store.usableSnapshot("2024-05-01") == nullptr);
    std::cout << "[TEST] Feedback staleness PASSED" << std::endl;
}

void testJsonDocument() {
    const auto path = std::filesystem::temp_directory_path() / "patternedge_test_feedback.json";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        FeedbackStore store(FeedbackConfig{}, std::make_shared<core::FeedbackStateStoreJson>(path));
        store.load();
        store.ingest(mixedOutcomes(), "2024-03-10");
        assert(store.save());
    }

    FeedbackStore reloaded(FeedbackConfig{}, std::make_shared<core::FeedbackStateStoreJson>(path));
    reloaded.load();
    const auto snap = reloaded.snapshot();
    const auto expected = FeedbackStore::build(mixedOutcomes(), "2024-03-10", FeedbackConfig{});
    assert(snap->version == 1);
    assert(snap->updated_at == "2024-03-10");
    assert(snap->outcomes.size() == expected.outcomes.size());
    assert(snap->adjustments.size() == expected.adjustments.size());
    assert(snap->rules.size() == expected.rules.size());
    assert(snap->filters.size() == expected.filters.size());
    const auto* reject = snap->filter(AdjustmentKey::forHorizon("shooting_star", "Swing_5d"));
    assert(reject && reject->action == FilterAction::REJECT);
    assert(snap->outcomes.front().stop_loss_triggered == expected.outcomes.front().stop_loss_triggered);

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] Feedback JSON document PASSED" << std::endl;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting Feedback Test..." << std::endl;
    testBlendWeight();
    testScenarioTripleBlend();
    testCascade();
    testRuleBoost();
    testRebuild();
    testDecay();
    testIngestValidationAndDedup();
    testConcurrentIngest();
    testVersionConflict();
    testStaleness();
    testJsonDocument();
    std::cout << "[TEST] Feedback Test PASSED!" << std::endl;
    return 0;
}
