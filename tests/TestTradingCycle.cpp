#include "core/orchestration/TradingCycleCoordinator.h"
#include "data/DataHistory.h"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace patternedge;
using namespace patternedge::core;

namespace {

class MemoryJournal : public IEventJournal {
public:
    bool append(const JournalEvent& event) override {
        JournalEvent e = event;
        e.seq = ++last_seq_;
        events_.push_back(e);
        return true;
    }
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override {
        std::vector<JournalEvent> out;
        for (const auto& e : events_) {
            if (e.seq >= seq_inclusive) out.push_back(e);
        }
        return out;
    }
    std::vector<JournalEvent> tail(std::size_t limit) override {
        const std::size_t from = events_.size() > limit ? events_.size() - limit : 0;
        return std::vector<JournalEvent>(events_.begin() + static_cast<std::ptrdiff_t>(from), events_.end());
    }
    std::uint64_t lastSeq() const override { return last_seq_; }

    int count(JournalEventType type) const {
        int n = 0;
        for (const auto& e : events_) {
            if (e.type == type) ++n;
        }
        return n;
    }

private:
    std::vector<JournalEvent> events_;
    std::uint64_t last_seq_ = 0;
};

analytics::Observation makeObs(const std::string& pattern, const std::string& instrument,
                               const std::string& sector, bool bullish, int day) {
    analytics::Observation o;
    o.patterns = {pattern};
    o.instrument = instrument;
    o.sector = sector;
    o.timeframe = "daily";
    o.trend = "bullish";
    o.volatility_zone = "normal";
    o.price_position = "mid";
    o.market_regime = "bull|low_vol";
    char ts[32];
    std::snprintf(ts, sizeof(ts), "2023-%02d-%02d", 1 + (day / 28) % 12, 1 + day % 28);
    o.timestamp = ts;
    o.close = 100.0;
    o.atr = 1.0;
    analytics::HorizonOutcome out;
    out.direction = bullish ? Direction::BULLISH : Direction::BEARISH;
    out.return_pct = bullish ? 1.0 : -1.0;
    out.mfe_pct = bullish ? 1.5 : 0.4;
    out.mae_pct = bullish ? -0.5 : -1.2;
    for (int h : {1, 3, 5, 10}) {
        o.outcomes[h] = out;
    }
    return o;
}

// bullish_engulfing is bullish 90% of the time against a 50% base rate
std::vector<analytics::Observation> history() {
    const char* sectors[] = {"banking", "it", "energy", "pharma"};
    std::vector<analytics::Observation> obs;
    for (int i = 0; i < 40; ++i) {
        obs.push_back(makeObs("bullish_engulfing", "stock" + std::to_string(i % 10), sectors[i % 4], i < 36, i));
    }
    for (int i = 0; i < 60; ++i) {
        obs.push_back(makeObs("spinning_top", "filler" + std::to_string(i % 20), sectors[i % 4], i < 14, i));
    }
    return obs;
}

analytics::Observation liveObs(const std::vector<std::string>& patterns = {"bullish_engulfing"}) {
    analytics::Observation o = makeObs("bullish_engulfing", "newco", "banking", true, 0);
    o.patterns = patterns;
    o.outcomes.clear();
    o.timestamp = "2024-03-04";
    return o;
}

DailyBar bar(const std::string& date, double open, double high, double low, double close) {
    DailyBar b;
    b.date = date;
    b.open = open;
    b.high = high;
    b.low = low;
    b.close = close;
    return b;
}

struct Harness {
    Harness() {
        config.lifecycle.min_rr_ratio = 1.4;
        config.storage.prediction_workers = 2;

        auto index = std::make_shared<analytics::ObservationIndex>(history(), config.predictor.primary_horizon);
        predictor = std::make_shared<analytics::TieredPredictor>(index, config.predictor, config.feedback);
        feedback = std::make_shared<engine::FeedbackStore>(config.feedback, nullptr);
        regime = std::make_shared<analytics::RegimeDetector>(config.regime, std::vector<DailyBar>{},
                                                             std::vector<DailyBar>{});
        risk_manager = std::make_shared<risk::RiskManager>(config.risk, nullptr);
        lifecycle = std::make_shared<engine::TradeLifecycleEngine>(config.lifecycle, nullptr, *risk_manager);
        market = std::make_shared<data::DataHistory>();
        journal = std::make_shared<MemoryJournal>();
        coordinator = std::make_unique<TradingCycleCoordinator>(
            config, predictor, feedback, regime, risk_manager, lifecycle, market, journal);
    }

    engine::EngineConfig config;
    std::shared_ptr<analytics::TieredPredictor> predictor;
    std::shared_ptr<engine::FeedbackStore> feedback;
    std::shared_ptr<analytics::RegimeDetector> regime;
    std::shared_ptr<risk::RiskManager> risk_manager;
    std::shared_ptr<engine::TradeLifecycleEngine> lifecycle;
    std::shared_ptr<data::DataHistory> market;
    std::shared_ptr<MemoryJournal> journal;
    std::unique_ptr<TradingCycleCoordinator> coordinator;
};

analytics::QueryContext contextOf(const analytics::Observation& o) {
    analytics::QueryContext ctx;
    ctx.timeframe = o.timeframe;
    ctx.trend = o.trend;
    ctx.volatility_zone = o.volatility_zone;
    ctx.price_position = o.price_position;
    ctx.instrument = o.instrument;
    ctx.sector = o.sector;
    return ctx;
}

void testPlanHorizons() {
    Harness h;
    const auto obs = liveObs();
    const auto prediction = h.predictor->predict("bullish_engulfing", contextOf(obs));
    assert(prediction.has_value());
    assert(prediction->direction == Direction::BULLISH);
    assert(std::abs(prediction->win_rate - 90.0) < 1e-9);
    assert(prediction->confidence_level == ConfidenceLevel::HIGH);

    const auto plans = h.coordinator->planHorizons(*prediction, obs);
    assert(plans.size() == 4);
    // sl = scale * 1.5 * atr / close, target = sl * rr_min (avg return 0.8 is smaller)
    const double expected_sl[] = {1.05, 1.2, 1.5, 1.8};
    const double expected_rr[] = {1.5, 1.8, 2.0, 2.0};
    for (std::size_t i = 0; i < plans.size(); ++i) {
        assert(std::abs(plans[i].sl_pct - expected_sl[i]) < 1e-9);
        assert(std::abs(plans[i].target_pct - expected_sl[i] * expected_rr[i]) < 1e-9);
        assert(plans[i].direction == Direction::BULLISH);
    }
    assert(plans[0].horizon_label == "BTST_1d");
    assert(plans[3].horizon_label == "Swing_10d");

    // a structural pattern widens the stop
    const auto structural = liveObs({"bullish_engulfing", "bullish_harami"});
    const auto wide = h.coordinator->planHorizons(*prediction, structural);
    assert(std::abs(wide[2].sl_pct - 2.0) < 1e-9);
    assert(std::abs(wide[3].sl_pct - 2.4) < 1e-9);
    std::cout << "[TEST] TradingCycle planHorizons PASSED" << std::endl;
}

void testDryRunScan() {
    Harness h;
    const auto decisions = h.coordinator->scan("2024-03-04", {liveObs()}, true);
    assert(decisions.size() == 4);
    for (const auto& d : decisions) {
        assert(d.accepted);
        assert(d.trade_id.empty());
        assert(d.sizing.position_pct > 0.0);
        assert(d.sizing.position_pct <= h.config.sizing.max_position_pct);
    }
    assert(h.lifecycle->trades().empty());
    assert(!h.lifecycle->wasScanned("2024-03-04"));
    assert(h.journal->lastSeq() == 0);

    // untradeable patterns never produce a signal
    assert(h.coordinator->scan("2024-03-04", {liveObs({"doji"})}, true).empty());
    std::cout << "[TEST] TradingCycle dry-run scan PASSED" << std::endl;
}

void testSessions() {
    Harness h;
    const auto first = h.coordinator->runSession("2024-03-04", {liveObs()});
    assert(first.scanned);
    assert(first.catch_up_days == 0);
    assert(first.signals == 4);
    // two banking positions fill the sector cap
    assert(first.accepted == 2);
    assert(first.rejected == 2);
    assert(first.duplicates == 0);
    assert(first.regime == "bull_low_vol");
    assert(h.lifecycle->openTrades().size() == 2);
    assert(h.journal->count(JournalEventType::REGIME_DETECTED) == 1);
    assert(h.journal->count(JournalEventType::SIGNAL_ACCEPTED) == 2);
    assert(h.journal->count(JournalEventType::SIGNAL_REJECTED) == 2);
    // 20% of two rejections still follows one of them without capital
    assert(first.shadows_tracked == 1);
    const auto shadows = h.lifecycle->shadowTrades();
    assert(shadows.size() == 1);
    assert(shadows[0].id == "SH000001");
    assert(shadows[0].status == TradeStatus::OPEN);
    assert(!shadows[0].skip_reasons.empty());
    assert(shadows[0].sector == "banking");
    assert(first.daily.trades_opened == 2);
    assert(first.daily.trades_closed == 0);

    const auto rescan = h.coordinator->scan("2024-03-04", {liveObs()});
    assert(rescan.empty());

    h.market->setBars("newco", {
        bar("2024-03-05", 100.2, 102.0, 99.5, 101.8),
        bar("2024-03-06", 101.0, 101.0, 99.8, 100.5)});

    // 03-05 was skipped and is monitored during catch-up
    const auto second = h.coordinator->runSession("2024-03-06", {});
    assert(second.catch_up_days == 1);
    assert(second.scanned && second.signals == 0);
    assert(second.outcomes_ingested == 1);

    const auto btst = h.lifecycle->find("PT000001");
    assert(btst && btst->status == TradeStatus::CLOSED_TARGET);
    assert(btst->exit_date == "2024-03-05");
    assert(btst->feedback_recorded);
    const auto swing = h.lifecycle->find("PT000002");
    assert(swing && swing->status == TradeStatus::OPEN);
    assert(swing->last_checked_date == "2024-03-06");

    assert(h.risk_manager->state().total_trades == 1);
    assert(h.risk_manager->state().total_wins == 1);
    assert(h.feedback->snapshot()->outcomes.size() == 1);
    assert(h.journal->count(JournalEventType::OUTCOMES_INGESTED) == 1);

    // Saturday: no scan, catch-up runs 03-07 and 03-08 and the swing trade expires
    const auto weekend = h.coordinator->runSession("2024-03-09", {liveObs()});
    assert(!weekend.scanned);
    assert(weekend.catch_up_days == 2);
    assert(weekend.outcomes_ingested == 1);
    const auto expired = h.lifecycle->find("PT000002");
    assert(expired->status == TradeStatus::CLOSED_EXPIRY);
    assert(std::abs(expired->exit_price - 100.5) < 1e-9);
    assert(expired->exit_date == "2024-03-07");
    assert(h.lifecycle->openTrades().empty());
    // the shadow never touches the risk book
    assert(h.risk_manager->state().total_trades == 2);
    assert(h.lifecycle->shadowTrades().size() == 1);
    std::cout << "[TEST] TradingCycle sessions PASSED" << std::endl;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting TradingCycle Test..." << std::endl;
    testPlanHorizons();
    testDryRunScan();
    testSessions();
    std::cout << "[TEST] TradingCycle Test PASSED!" << std::endl;
    return 0;
}
