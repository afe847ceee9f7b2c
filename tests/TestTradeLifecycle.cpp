#include "engine/TradeLifecycleEngine.h"
#include "core/execution/TradeLifecycleStateMachine.h"
#include "core/state/JsonFileIO.h"
#include "core/state/TradeStoreJson.h"
#include "data/DataHistory.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

using namespace patternedge;
using namespace patternedge::engine;

namespace {

class MemoryTradeStore : public core::ITradeStore {
public:
    std::optional<core::TradeBook> load() override { return stored; }
    bool save(const core::TradeBook& book, std::uint64_t expected_version) override {
        if (fail) {
            return false;
        }
        const std::uint64_t on_disk = stored ? stored->version : 0;
        if (on_disk != expected_version) {
            throw VersionConflictError("stale trade book");
        }
        stored = book;
        return true;
    }
    std::optional<core::TradeBook> stored;
    bool fail = false;
};

class MemoryRiskStore : public core::IRiskStateStore {
public:
    std::optional<risk::RiskState> load() override { return stored; }
    bool save(const risk::RiskState& state, std::uint64_t) override {
        stored = state;
        return true;
    }
    std::optional<risk::RiskState> stored;
};

DailyBar bar(const std::string& date, double open, double high, double low, double close) {
    DailyBar b;
    b.date = date;
    b.open = open;
    b.high = high;
    b.low = low;
    b.close = close;
    return b;
}

TradeSignal makeSignal(const std::string& instrument, int horizon, Direction dir = Direction::BULLISH,
                   const std::string& sector = "banking") {
    TradeSignal s;
    s.instrument = instrument;
    s.sector = sector;
    s.direction = dir;
    s.patterns = {"bullish_engulfing"};
    s.horizon_days = horizon;
    s.signal_date = "2024-03-04";
    s.signal_close = 100.0;
    s.sl_pct = 2.0;
    s.target_pct = 4.0;
    s.rr_ratio = 2.0;
    s.position_pct = 3.0;
    s.position_value = 30000.0;
    s.predicted_win_rate = 62.0;
    s.confidence_level = ConfidenceLevel::MEDIUM;
    s.trend = "bullish";
    return s;
}

struct Fixture {
    explicit Fixture(LifecycleConfig config = LifecycleConfig{}, RiskConfig risk_config = RiskConfig{})
        : trade_store(std::make_shared<MemoryTradeStore>())
        , risk_store(std::make_shared<MemoryRiskStore>())
        , risk_manager(risk_config, risk_store)
        , lifecycle(config, trade_store, risk_manager) {}

    std::shared_ptr<MemoryTradeStore> trade_store;
    std::shared_ptr<MemoryRiskStore> risk_store;
    risk::RiskManager risk_manager;
    TradeLifecycleEngine lifecycle;
    data::DataHistory market;
};

void testAcceptAndDedup() {
    Fixture f;
    const auto first = f.lifecycle.accept(makeSignal("sbin", 3));
    assert(first.status == AcceptStatus::ACCEPTED);
    assert(first.trade_id == "PT000001");

    const auto t = f.lifecycle.find(first.trade_id);
    assert(t.has_value());
    assert(t->filled && t->entry_price == 100.0 && t->entry_date == "2024-03-04");
    assert(std::abs(t->sl_price - 98.0) < 1e-9);
    assert(std::abs(t->target_price - 104.0) < 1e-9);
    assert(t->expiry_date == "2024-03-07");
    assert(t->horizon_label == "Swing_3d");

    const auto dup = f.lifecycle.accept(makeSignal("sbin", 3));
    assert(dup.status == AcceptStatus::DUPLICATE);
    assert(dup.trade_id == first.trade_id);
    assert(f.lifecycle.trades().size() == 1);

    const auto other = f.lifecycle.accept(makeSignal("sbin", 5));
    assert(other.status == AcceptStatus::ACCEPTED);
    assert(other.trade_id == "PT000002");
    assert(f.trade_store->stored->trades.size() == 2);

    // sector cap of 2 is now reached
    const auto third = f.lifecycle.accept(makeSignal("hdfcbank", 1));
    assert(third.status == AcceptStatus::REJECTED_RISK);
    assert(third.reason.find("sector_limit") == 0);
    assert(f.lifecycle.openPositions().size() == 2);
    std::cout << "[TEST] Lifecycle accept/dedup PASSED" << std::endl;
}

void testStopLossFirst() {
    Fixture f;
    const auto id = f.lifecycle.accept(makeSignal("sbin", 3)).trade_id;
    // both levels inside one bar, the stop wins
    f.market.setBars("sbin", {bar("2024-03-05", 100.0, 105.0, 97.0, 101.0)});

    const auto report = f.lifecycle.monitor("2024-03-05", f.market);
    assert(report.closed == 1);
    const auto t = *f.lifecycle.find(id);
    assert(t.status == TradeStatus::CLOSED_SL);
    assert(t.exit_reason == "sl_hit");
    assert(std::abs(t.exit_price - 98.0) < 1e-9);
    assert(std::abs(t.return_pct + 2.0) < 1e-9);
    assert(std::abs(t.pnl + 600.0) < 1e-6);
    assert(std::abs(t.mae_pct + 3.0) < 1e-9);

    assert(f.risk_manager.isApplied(id));
    assert(std::abs(f.risk_manager.state().capital - (1000000.0 - 600.0)) < 1e-6);

    const auto outcomes = f.lifecycle.drainOutcomes();
    assert(outcomes.size() == 1);
    assert(outcomes[0].stop_loss_triggered);
    assert(!outcomes[0].won);
    outcomes[0].validate();
    std::cout << "[TEST] Lifecycle stop-loss priority PASSED" << std::endl;
}

void testTargetAndBearish() {
    Fixture f;
    const auto long_id = f.lifecycle.accept(makeSignal("sbin", 3)).trade_id;
    const auto short_id = f.lifecycle.accept(makeSignal("tcs", 3, Direction::BEARISH, "it")).trade_id;
    const auto short_t = *f.lifecycle.find(short_id);
    assert(std::abs(short_t.sl_price - 102.0) < 1e-9);
    assert(std::abs(short_t.target_price - 96.0) < 1e-9);

    f.market.setBars("sbin", {bar("2024-03-05", 100.0, 104.5, 99.0, 104.0)});
    f.market.setBars("tcs", {bar("2024-03-05", 100.0, 101.0, 95.5, 96.0)});
    f.lifecycle.monitor("2024-03-05", f.market);

    const auto l = *f.lifecycle.find(long_id);
    assert(l.status == TradeStatus::CLOSED_TARGET && std::abs(l.return_pct - 4.0) < 1e-9);
    const auto s = *f.lifecycle.find(short_id);
    assert(s.status == TradeStatus::CLOSED_TARGET && std::abs(s.return_pct - 4.0) < 1e-9);
    assert(f.risk_manager.state().total_wins == 2);
    std::cout << "[TEST] Lifecycle target/bearish PASSED" << std::endl;
}

void testExpiryAndIdempotentMonitor() {
    Fixture f;
    const auto id = f.lifecycle.accept(makeSignal("sbin", 3)).trade_id;
    f.market.setBars("sbin", {
        bar("2024-03-04", 99.0, 100.5, 98.5, 100.0),     // signal bar is not re-checked
        bar("2024-03-05", 100.0, 102.0, 99.0, 101.0),
        bar("2024-03-06", 101.0, 103.0, 100.0, 102.0),
        bar("2024-03-07", 102.0, 103.5, 101.0, 103.0),
        bar("2024-03-08", 103.0, 110.0, 90.0, 95.0)});   // after expiry, never used

    auto r = f.lifecycle.monitor("2024-03-06", f.market);
    assert(r.checked == 1 && r.closed == 0);
    auto t = *f.lifecycle.find(id);
    assert(t.status == TradeStatus::OPEN);
    assert(std::abs(t.mfe_pct - 3.0) < 1e-9);
    assert(t.last_checked_date == "2024-03-06");

    // re-running the same day changes nothing
    const auto version = f.trade_store->stored->version;
    f.lifecycle.monitor("2024-03-06", f.market);
    assert(f.trade_store->stored->version == version);

    r = f.lifecycle.monitor("2024-03-08", f.market);
    assert(r.closed == 1);
    t = *f.lifecycle.find(id);
    assert(t.status == TradeStatus::CLOSED_EXPIRY);
    assert(t.exit_reason == "expired");
    assert(t.exit_date == "2024-03-07");
    assert(std::abs(t.exit_price - 103.0) < 1e-9);

    const int trades_after = f.risk_manager.state().total_trades;
    r = f.lifecycle.monitor("2024-03-08", f.market);
    assert(r.checked == 0 && r.closed == 0);
    assert(f.risk_manager.state().total_trades == trades_after);
    assert(f.lifecycle.drainOutcomes().size() == 1);
    assert(f.lifecycle.drainOutcomes().empty());
    std::cout << "[TEST] Lifecycle expiry/idempotent PASSED" << std::endl;
}

void testNextOpenEntry() {
    LifecycleConfig cfg;
    cfg.entry_timing = EntryTiming::NEXT_OPEN;
    Fixture f(cfg);
    const auto res = f.lifecycle.accept(makeSignal("sbin", 3));
    assert(res.status == AcceptStatus::PENDING_FILL);
    assert(!f.lifecycle.find(res.trade_id)->filled);

    // no bar yet, stays pending
    assert(f.lifecycle.monitor("2024-03-04", f.market).filled == 0);

    f.market.setBars("sbin", {bar("2024-03-05", 101.0, 102.0, 100.5, 101.5)});
    const auto r = f.lifecycle.monitor("2024-03-05", f.market);
    assert(r.filled == 1 && r.closed == 0);
    const auto t = *f.lifecycle.find(res.trade_id);
    assert(t.filled && t.entry_price == 101.0 && t.entry_date == "2024-03-05");
    assert(std::abs(t.sl_price - 101.0 * 0.98) < 1e-9);
    std::cout << "[TEST] Lifecycle next-open fill PASSED" << std::endl;
}

void testNextOpenCancelledByRisk() {
    LifecycleConfig cfg;
    cfg.entry_timing = EntryTiming::NEXT_OPEN;
    RiskConfig rc;
    rc.max_daily_loss_pct = 1.0;
    Fixture f(cfg, rc);
    const auto res = f.lifecycle.accept(makeSignal("sbin", 3));

    risk::TradeClose big;
    big.trade_id = "external";
    big.pnl = -20000.0;
    big.exit_date = "2024-03-04";
    f.risk_manager.recordTradeClose(big);
    assert(!f.risk_manager.canTrade());

    f.market.setBars("sbin", {bar("2024-03-05", 101.0, 102.0, 100.5, 101.5)});
    const auto r = f.lifecycle.monitor("2024-03-05", f.market);
    assert(r.cancelled == 1);
    const auto t = *f.lifecycle.find(res.trade_id);
    assert(t.status == TradeStatus::CANCELLED);
    assert(t.exit_reason.find("circuit_breaker") == 0);
    // cancelled trades carry no outcome
    assert(f.lifecycle.drainOutcomes().empty());
    std::cout << "[TEST] Lifecycle next-open cancel PASSED" << std::endl;
}

void testExpiryOnMarketHoliday() {
    Fixture f;
    auto signal = makeSignal("sbin", 1);
    signal.signal_date = "2024-03-08";
    const auto id = f.lifecycle.accept(signal).trade_id;
    auto t = *f.lifecycle.find(id);
    assert(t.expiry_date == "2024-03-11");

    // exchange closed on the expiry day
    f.market.setBars("sbin", {
        bar("2024-03-08", 99.0, 100.5, 98.5, 100.0),
        bar("2024-03-12", 99.0, 99.5, 98.6, 99.2),
        bar("2024-03-13", 99.2, 101.0, 99.0, 100.8),
        bar("2024-03-20", 100.0, 105.0, 90.0, 92.0)});

    const auto r = f.lifecycle.monitor("2024-03-12", f.market);
    assert(r.closed == 1);
    t = *f.lifecycle.find(id);
    assert(t.status == TradeStatus::CLOSED_EXPIRY);
    assert(t.exit_date == "2024-03-11");
    // last close on or before expiry is the signal bar
    assert(std::abs(t.exit_price - 100.0) < 1e-9);
    assert(std::abs(t.return_pct) < 1e-9);
    assert(f.risk_manager.isApplied(id));
    assert(f.lifecycle.openPositions().empty());

    for (const char* later : {"2024-03-13", "2024-03-20", "2024-06-28"}) {
        const auto again = f.lifecycle.monitor(later, f.market);
        assert(again.checked == 0 && again.closed == 0);
    }
    assert(f.risk_manager.state().total_trades == 1);
    assert(f.lifecycle.drainOutcomes().size() == 1);

    // no bar at all up to expiry: closed flat at the entry price
    Fixture empty;
    const auto flat_id = empty.lifecycle.accept(signal).trade_id;
    empty.lifecycle.monitor("2024-03-13", empty.market);
    const auto flat = *empty.lifecycle.find(flat_id);
    assert(flat.status == TradeStatus::CLOSED_EXPIRY);
    assert(flat.exit_price == flat.entry_price);
    std::cout << "[TEST] Lifecycle holiday expiry PASSED" << std::endl;
}

void testNextOpenExpiredBeforeFill() {
    LifecycleConfig cfg;
    cfg.entry_timing = EntryTiming::NEXT_OPEN;
    Fixture f(cfg);
    const auto quiet = f.lifecycle.accept(makeSignal("sbin", 1)).trade_id;
    const auto late = f.lifecycle.accept(makeSignal("tcs", 1, Direction::BULLISH, "it")).trade_id;
    assert(f.lifecycle.find(quiet)->expiry_date == "2024-03-05");

    // first bar arrives two days after expiry
    f.market.setBars("tcs", {bar("2024-03-07", 100.0, 101.0, 99.0, 100.5)});

    auto r = f.lifecycle.monitor("2024-03-05", f.market);
    assert(r.cancelled == 0 && r.filled == 0);

    r = f.lifecycle.monitor("2024-03-07", f.market);
    assert(r.cancelled == 2 && r.filled == 0);
    for (const auto& id : {quiet, late}) {
        const auto t = *f.lifecycle.find(id);
        assert(t.status == TradeStatus::CANCELLED);
        assert(t.exit_reason == "expired_before_fill");
        assert(t.exit_date == "2024-03-05");
        assert(!t.filled);
    }
    assert(f.lifecycle.openTrades().empty());
    assert(f.lifecycle.drainOutcomes().empty());
    assert(f.risk_manager.state().total_trades == 0);
    std::cout << "[TEST] Lifecycle next-open expired before fill PASSED" << std::endl;
}

void testShadowTrades() {
    Fixture f;
    assert(f.lifecycle.recordShadow(makeSignal("tcs", 3, Direction::BULLISH, "it"), {"low win rate"}));
    assert(!f.lifecycle.recordShadow(makeSignal("tcs", 3, Direction::BULLISH, "it"), {"low R:R ratio"}));
    assert(f.lifecycle.recordShadow(makeSignal("infy", 3, Direction::BEARISH, "it"), {"sector penalty: weak"}));

    // shadows hold no capital and do not block a real entry on the same instrument
    const auto real = f.lifecycle.accept(makeSignal("tcs", 3, Direction::BULLISH, "it"));
    assert(real.status == AcceptStatus::ACCEPTED);
    assert(real.trade_id == "PT000001");
    assert(f.lifecycle.openPositions().size() == 1);

    auto shadows = f.lifecycle.shadowTrades();
    assert(shadows.size() == 2);
    assert(shadows[0].id == "SH000001" && shadows[1].id == "SH000002");
    assert(shadows[0].skip_reasons.size() == 1 && shadows[0].skip_reasons[0] == "low win rate");
    assert(shadows[0].filled && shadows[0].entry_price == 100.0);
    assert(std::abs(shadows[1].sl_price - 102.0) < 1e-9);
    assert(f.trade_store->stored->next_shadow_id == 3);

    f.market.setBars("tcs", {bar("2024-03-05", 100.0, 104.5, 99.0, 104.0)});
    f.market.setBars("infy", {bar("2024-03-05", 100.0, 102.5, 99.0, 102.0)});
    const auto r = f.lifecycle.monitor("2024-03-05", f.market);
    assert(r.checked == 1);
    assert(r.closed == 1);
    assert(r.shadow_closed == 2);

    shadows = f.lifecycle.shadowTrades();
    assert(shadows[0].status == TradeStatus::CLOSED_TARGET && std::abs(shadows[0].return_pct - 4.0) < 1e-9);
    assert(shadows[1].status == TradeStatus::CLOSED_SL && std::abs(shadows[1].return_pct + 2.0) < 1e-9);
    assert(!f.lifecycle.find("SH000001").has_value());

    // only the real trade reaches the risk book and the feedback queue
    assert(f.risk_manager.state().total_trades == 1);
    const auto outcomes = f.lifecycle.drainOutcomes();
    assert(outcomes.size() == 1 && outcomes[0].trade_id == "PT000001");
    std::cout << "[TEST] Lifecycle shadow trades PASSED" << std::endl;
}

void testAtomicStateWrite() {
    const auto dir = std::filesystem::temp_directory_path() / "patternedge_test_state_dir";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    const auto path = dir / "nested" / "book.json";
    assert(core::writeJsonAtomically(path, nlohmann::json{{"version", 1}}));
    assert(core::writeJsonAtomically(path, nlohmann::json{{"version", 2}, {"trades", nlohmann::json::array()}}));
    auto tmp = path;
    tmp += ".tmp";
    assert(!std::filesystem::exists(tmp));
    const auto stored = core::readJsonFile(path);
    assert(stored && stored->value("version", 0) == 2);
    core::checkStoredVersion(path, 2);

    // a regular file where the directory should be
    const auto blocker = dir / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    assert(!core::writeJsonAtomically(blocker / "book.json", nlohmann::json{{"version", 1}}));
    // the previous document is untouched by a failed write
    assert(core::readJsonFile(path)->value("version", 0) == 2);

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] Lifecycle atomic state write PASSED" << std::endl;
}

void testStateMachine() {
    using core::execution::TradeLifecycleStateMachine;
    auto r = TradeLifecycleStateMachine::transition(TradeStatus::OPEN, "expired");
    assert(r.changed && r.terminal && r.status == TradeStatus::CLOSED_EXPIRY);
    r = TradeLifecycleStateMachine::transition(TradeStatus::OPEN, "SL_HIT");
    assert(r.status == TradeStatus::CLOSED_SL);
    r = TradeLifecycleStateMachine::transition(TradeStatus::OPEN, "bogus");
    assert(!r.changed && r.status == TradeStatus::OPEN);
    for (auto terminal : {TradeStatus::CLOSED_SL, TradeStatus::CLOSED_TARGET,
                          TradeStatus::CLOSED_EXPIRY, TradeStatus::CANCELLED}) {
        for (const char* event : {"sl_hit", "target_hit", "expired", "cancel"}) {
            r = TradeLifecycleStateMachine::transition(terminal, event);
            assert(!r.changed && r.terminal && r.status == terminal);
        }
    }
    std::cout << "[TEST] Lifecycle state machine PASSED" << std::endl;
}

void testReconcile() {
    auto trade_store = std::make_shared<MemoryTradeStore>();
    data::DataHistory market;
    market.setBars("sbin", {bar("2024-03-05", 100.0, 100.5, 97.0, 97.5)});
    std::string id;
    {
        risk::RiskManager risk_manager(RiskConfig{}, std::make_shared<MemoryRiskStore>());
        TradeLifecycleEngine engine(LifecycleConfig{}, trade_store, risk_manager);
        id = engine.accept(makeSignal("sbin", 3)).trade_id;
        engine.monitor("2024-03-05", market);
    }

    // risk state lost the close and the outcome was never flushed
    risk::RiskManager fresh(RiskConfig{}, std::make_shared<MemoryRiskStore>());
    TradeLifecycleEngine restarted(LifecycleConfig{}, trade_store, fresh);
    assert(!fresh.isApplied(id));
    assert(restarted.reconcile() == 1);
    assert(fresh.isApplied(id));
    assert(restarted.reconcile() == 0);

    const auto outcomes = restarted.drainOutcomes();
    assert(outcomes.size() == 1 && outcomes[0].trade_id == id);
    restarted.markFeedbackRecorded({id});
    assert(trade_store->stored->trades[0].feedback_recorded);
    restarted.reconcile();
    assert(restarted.drainOutcomes().empty());
    std::cout << "[TEST] Lifecycle reconcile PASSED" << std::endl;
}

void testScannedDatesAndPersistence() {
    const auto path = std::filesystem::temp_directory_path() / "patternedge_test_trades.json";
    std::error_code ec;
    std::filesystem::remove(path, ec);
    {
        risk::RiskManager risk_manager(RiskConfig{}, nullptr);
        TradeLifecycleEngine engine(LifecycleConfig{}, std::make_shared<core::TradeStoreJson>(path), risk_manager);
        assert(engine.lastScanDate().empty());
        engine.accept(makeSignal("sbin", 3));
        engine.markScanned("2024-03-01");
        engine.markScanned("2024-03-04");
        engine.markScanned("2024-03-04");
        engine.recordShadow(makeSignal("infy", 5, Direction::BULLISH, "it"), {"low R:R ratio"});
    }
    auto tmp = path;
    tmp += ".tmp";
    assert(!std::filesystem::exists(tmp));
    risk::RiskManager risk_manager(RiskConfig{}, nullptr);
    TradeLifecycleEngine reloaded(LifecycleConfig{}, std::make_shared<core::TradeStoreJson>(path), risk_manager);
    assert(reloaded.wasScanned("2024-03-01"));
    assert(!reloaded.wasScanned("2024-03-05"));
    assert(reloaded.lastScanDate() == "2024-03-04");
    assert(reloaded.openTrades().size() == 1);
    // ids keep counting after a reload
    assert(reloaded.accept(makeSignal("tcs", 3, Direction::BULLISH, "it")).trade_id == "PT000002");
    const auto shadows = reloaded.shadowTrades();
    assert(shadows.size() == 1 && shadows[0].id == "SH000001");
    assert(shadows[0].skip_reasons == std::vector<std::string>{"low R:R ratio"});
    assert(shadows[0].status == TradeStatus::OPEN && shadows[0].horizon_days == 5);
    assert(reloaded.recordShadow(makeSignal("wipro", 5, Direction::BULLISH, "it"), {"low win rate"}));
    assert(reloaded.shadowTrades().back().id == "SH000002");
    std::filesystem::remove(path, ec);
    std::cout << "[TEST] Lifecycle persistence PASSED" << std::endl;
}

void testFailingStore() {
    Fixture f;
    f.lifecycle.accept(makeSignal("sbin", 3));
    f.trade_store->fail = true;
    bool threw = false;
    try {
        f.lifecycle.accept(makeSignal("tcs", 3, Direction::BULLISH, "it"));
    } catch (const PersistenceError&) {
        threw = true;
    }
    assert(threw);
    assert(f.lifecycle.trades().size() == 1);
    std::cout << "[TEST] Lifecycle failing store PASSED" << std::endl;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting TradeLifecycle Test..." << std::endl;
    testAcceptAndDedup();
    testStopLossFirst();
    testTargetAndBearish();
    testExpiryAndIdempotentMonitor();
    testNextOpenEntry();
    testNextOpenCancelledByRisk();
    testExpiryOnMarketHoliday();
    testNextOpenExpiredBeforeFill();
    testShadowTrades();
    testAtomicStateWrite();
    testStateMachine();
    testReconcile();
    testScannedDatesAndPersistence();
    testFailingStore();
    std::cout << "[TEST] TradeLifecycle Test PASSED!" << std::endl;
    return 0;
}
