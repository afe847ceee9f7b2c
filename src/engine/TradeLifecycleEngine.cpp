#include "engine/TradeLifecycleEngine.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "core/execution/TradeLifecycleStateMachine.h"

#include <algorithm>
#include <cstdio>
#include <set>

namespace patternedge {
namespace engine {

namespace {

void setLevels(core::Trade& t) {
    if (t.direction == Direction::BEARISH) {
        t.sl_price = t.entry_price * (1.0 + t.sl_pct / 100.0);
        t.target_price = t.entry_price * (1.0 - t.target_pct / 100.0);
    } else {
        t.sl_price = t.entry_price * (1.0 - t.sl_pct / 100.0);
        t.target_price = t.entry_price * (1.0 + t.target_pct / 100.0);
    }
}

std::string formatTradeId(const char* prefix, long long n) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%06lld", prefix, n);
    return buf;
}

// Everything but id, sizing and the fill
core::Trade tradeFromSignal(const TradeSignal& signal) {
    core::Trade trade;
    trade.instrument = signal.instrument;
    trade.horizon_days = signal.horizon_days;
    trade.signal_date = signal.signal_date;
    trade.sector = signal.sector.empty() ? "unknown" : signal.sector;
    trade.direction = signal.direction;
    trade.patterns = signal.patterns;
    trade.horizon_label = horizonLabel(signal.horizon_days);
    trade.trend_at_entry = signal.trend.empty() ? "unknown" : signal.trend;
    trade.volume_ratio = signal.volume_ratio;
    trade.regime = signal.regime;
    trade.signal_price = signal.signal_close;
    trade.sl_pct = signal.sl_pct;
    trade.target_pct = signal.target_pct;
    trade.rr_ratio = signal.rr_ratio;
    trade.expiry_date = utils::DateUtils::addTradingDays(signal.signal_date, signal.horizon_days);
    trade.predicted_win_rate = signal.predicted_win_rate;
    trade.predicted_pf = signal.predicted_pf;
    trade.confidence = signal.confidence;
    trade.confidence_level = signal.confidence_level;
    trade.tier = signal.tier;
    trade.n_matches = signal.n_matches;
    return trade;
}

} // namespace

std::string toString(AcceptStatus status) {
    switch (status) {
        case AcceptStatus::ACCEPTED: return "accepted";
        case AcceptStatus::PENDING_FILL: return "pending_fill";
        case AcceptStatus::DUPLICATE: return "duplicate";
        case AcceptStatus::REJECTED_RISK: return "rejected_risk";
    }
    return "rejected_risk";
}

TradeLifecycleEngine::TradeLifecycleEngine(LifecycleConfig config,
                                           std::shared_ptr<core::ITradeStore> store,
                                           risk::RiskManager& risk,
                                           std::shared_ptr<core::IEventJournal> journal,
                                           Clock clock)
    : config_(std::move(config))
    , store_(std::move(store))
    , risk_(risk)
    , journal_(std::move(journal))
    , clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = getCurrentTimestampMs;
    }
    if (store_) {
        if (auto loaded = store_->load()) {
            book_ = std::move(*loaded);
        }
    }
    LOG_INFO("Trade book loaded (v{}): {} trades, {} open",
             book_.version, book_.trades.size(),
             std::count_if(book_.trades.begin(), book_.trades.end(),
                           [](const core::Trade& t) { return t.status == TradeStatus::OPEN; }));
}

// Caller holds mutex_
void TradeLifecycleEngine::commit(core::TradeBook next) {
    const std::uint64_t expected = book_.version;
    next.version = expected + 1;
    if (store_ && !store_->save(next, expected)) {
        throw PersistenceError("failed to persist trade book v" + std::to_string(next.version));
    }
    book_ = std::move(next);
}

void TradeLifecycleEngine::journal(core::JournalEventType type, const core::Trade& trade, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = clock_();
    event.type = type;
    event.instrument = trade.instrument;
    event.entity_id = trade.id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("journal append failed for trade {}", trade.id);
    }
}

std::vector<risk::OpenPositionView> TradeLifecycleEngine::openPositionsLocked(const std::string& exclude_id) const {
    std::vector<risk::OpenPositionView> out;
    for (const auto& t : book_.trades) {
        if (t.status == TradeStatus::OPEN && t.id != exclude_id) {
            out.push_back(risk::OpenPositionView{t.sector, t.horizon_days});
        }
    }
    return out;
}

AcceptResult TradeLifecycleEngine::accept(const TradeSignal& signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    AcceptResult result;

    core::Trade trade = tradeFromSignal(signal);
    const std::string key = trade.dedupKey();

    for (const auto& existing : book_.trades) {
        if (existing.dedupKey() == key) {
            LOG_INFO("Duplicate signal {} ignored (trade {})", key, existing.id);
            result.status = AcceptStatus::DUPLICATE;
            result.trade_id = existing.id;
            result.reason = "duplicate";
            return result;
        }
    }

    const auto check = risk_.validateEntry(signal.sector, signal.horizon_days, openPositionsLocked(""));
    if (!check.allowed) {
        LOG_WARN("{} {} rejected by risk: {}", signal.instrument, horizonLabel(signal.horizon_days), check.reason);
        result.status = AcceptStatus::REJECTED_RISK;
        result.reason = check.reason;
        return result;
    }

    core::TradeBook next = book_;
    const long long now = clock_();
    trade.id = formatTradeId("PT", next.next_id++);
    trade.position_pct = signal.position_pct;
    trade.position_value = signal.position_value;
    trade.created_at_ms = now;
    trade.updated_at_ms = now;

    if (config_.entry_timing == EntryTiming::SIGNAL_CLOSE) {
        trade.filled = true;
        trade.entry_price = signal.signal_close;
        trade.entry_date = signal.signal_date;
        setLevels(trade);
        result.status = AcceptStatus::ACCEPTED;
    } else {
        result.status = AcceptStatus::PENDING_FILL;
    }

    next.trades.push_back(trade);
    commit(std::move(next));
    result.trade_id = trade.id;

    LOG_INFO("Trade {} opened: {} {} {} entry {:.2f} SL {:.2f} ({:.2f}%) target {:.2f} ({:.2f}%) size {:.2f}%",
             trade.id, trade.instrument, toString(trade.direction), trade.horizon_label,
             trade.entry_price, trade.sl_price, trade.sl_pct, trade.target_price, trade.target_pct,
             trade.position_pct);
    journal(core::JournalEventType::TRADE_OPENED, trade, {
        {"filled", trade.filled},
        {"horizon", trade.horizon_label},
        {"entry_price", trade.entry_price},
        {"sl_pct", trade.sl_pct},
        {"target_pct", trade.target_pct},
        {"position_pct", trade.position_pct}});
    return result;
}

bool TradeLifecycleEngine::recordShadow(const TradeSignal& signal, const std::vector<std::string>& reasons) {
    std::lock_guard<std::mutex> lock(mutex_);

    core::Trade shadow = tradeFromSignal(signal);
    const std::string key = shadow.dedupKey();
    for (const auto& existing : book_.shadow_trades) {
        if (existing.dedupKey() == key) {
            return false;
        }
    }

    core::TradeBook next = book_;
    const long long now = clock_();
    shadow.id = formatTradeId("SH", next.next_shadow_id++);
    shadow.skip_reasons = reasons;
    // 자본 없이 시그널 종가에 진입한 것으로 추적
    shadow.filled = true;
    shadow.entry_price = signal.signal_close;
    shadow.entry_date = signal.signal_date;
    setLevels(shadow);
    shadow.created_at_ms = now;
    shadow.updated_at_ms = now;

    next.shadow_trades.push_back(shadow);
    commit(std::move(next));
    LOG_INFO("Shadow {} tracking {} {} {} (skipped: {})", shadow.id, shadow.instrument,
             toString(shadow.direction), shadow.horizon_label,
             reasons.empty() ? std::string("-") : reasons.front());
    return true;
}

std::optional<ExitCheck> TradeLifecycleEngine::checkExit(const core::Trade& trade, const DailyBar& bar) {
    // Stop-loss first: with only daily OHLC the worse case is assumed
    if (trade.direction == Direction::BEARISH) {
        if (bar.high >= trade.sl_price) {
            return ExitCheck{TradeStatus::CLOSED_SL, trade.sl_price, "sl_hit"};
        }
        if (bar.low <= trade.target_price) {
            return ExitCheck{TradeStatus::CLOSED_TARGET, trade.target_price, "target_hit"};
        }
    } else {
        if (bar.low <= trade.sl_price) {
            return ExitCheck{TradeStatus::CLOSED_SL, trade.sl_price, "sl_hit"};
        }
        if (bar.high >= trade.target_price) {
            return ExitCheck{TradeStatus::CLOSED_TARGET, trade.target_price, "target_hit"};
        }
    }
    return std::nullopt;
}

double TradeLifecycleEngine::returnPct(const core::Trade& trade, double exit_price) {
    if (trade.entry_price <= 0.0) {
        return 0.0;
    }
    const double raw = (exit_price - trade.entry_price) / trade.entry_price * 100.0;
    return trade.direction == Direction::BEARISH ? -raw : raw;
}

OutcomeRecord TradeLifecycleEngine::toOutcome(const core::Trade& t) {
    OutcomeRecord o;
    o.trade_id = t.id;
    o.instrument = t.instrument;
    o.sector = t.sector.empty() ? "unknown" : t.sector;
    o.direction = t.direction;
    o.patterns = t.patterns;
    o.horizon_days = t.horizon_days;
    o.horizon_label = t.horizon_label;
    o.trend_at_entry = t.trend_at_entry.empty() ? "unknown" : t.trend_at_entry;
    o.volume_ratio = t.volume_ratio;
    o.won = t.return_pct > 0.0;
    o.actual_return_pct = t.return_pct;
    o.exit_reason = t.exit_reason;
    o.stop_loss_triggered = t.status == TradeStatus::CLOSED_SL;
    o.entry_date = t.entry_date;
    o.exit_date = t.exit_date;
    o.predicted_win_rate = t.predicted_win_rate;
    o.confidence_level = toString(t.confidence_level);
    return o;
}

void TradeLifecycleEngine::closeTrade(core::Trade& trade, const ExitCheck& exit, const std::string& exit_date) {
    const auto transition = core::execution::TradeLifecycleStateMachine::transition(trade.status, exit.reason);
    if (!transition.changed) {
        return;
    }
    trade.status = transition.status;
    trade.exit_price = exit.exit_price;
    trade.exit_date = exit_date;
    trade.exit_reason = exit.reason;
    trade.return_pct = returnPct(trade, exit.exit_price);
    trade.pnl = trade.position_value * trade.return_pct / 100.0;
    trade.updated_at_ms = clock_();
}

// Caller holds mutex_
void TradeLifecycleEngine::applyClose(const core::Trade& trade) {
    risk::TradeClose close;
    close.trade_id = trade.id;
    close.instrument = trade.instrument;
    close.sector = trade.sector;
    close.horizon_days = trade.horizon_days;
    close.pnl = trade.pnl;
    close.return_pct = trade.return_pct;
    close.exit_date = trade.exit_date;

    const auto result = risk_.recordTradeClose(close);
    for (const auto& trip : result.tripped) {
        journal(core::JournalEventType::BREAKER_TRIPPED, trade, {
            {"breaker", risk::toString(trip.breaker)},
            {"value", trip.value},
            {"threshold", trip.threshold}});
    }
}

// Caller holds mutex_. Walks the bars after entry up to min(check_date, expiry) and
// closes on SL/target, or at the last close on or before expiry. True when the trade changed.
bool TradeLifecycleEngine::advance(core::Trade& trade, const std::string& check_date,
                                   const core::IMarketDataSource& data) {
    bool dirty = false;

    // Signal-close entries start on the next bar, next-open fills include the fill bar
    const std::string from = trade.entry_date == trade.signal_date
        ? utils::DateUtils::addDays(trade.entry_date, 1) : trade.entry_date;
    const std::string end = (std::min)(check_date, trade.expiry_date);
    if (from <= end) {
        const auto bars = data.bars(trade.instrument, from, end);
        double mfe = 0.0;
        double mae = 0.0;
        for (const auto& bar : bars) {
            const double best = trade.direction == Direction::BEARISH ? bar.low : bar.high;
            const double worst = trade.direction == Direction::BEARISH ? bar.high : bar.low;
            mfe = (std::max)(mfe, returnPct(trade, best));
            mae = (std::min)(mae, returnPct(trade, worst));

            if (const auto exit = checkExit(trade, bar)) {
                closeTrade(trade, *exit, bar.date);
                break;
            }
        }
        if (trade.mfe_pct != mfe || trade.mae_pct != mae || trade.last_checked_date != end) {
            trade.mfe_pct = mfe;
            trade.mae_pct = mae;
            trade.last_checked_date = end;
            dirty = true;
        }
    }

    if (trade.status == TradeStatus::OPEN && check_date >= trade.expiry_date) {
        // Expiry may fall on a market holiday, so look back over the whole history
        const auto history = data.bars(trade.instrument, "", trade.expiry_date);
        double exit_price = trade.entry_price;
        if (history.empty()) {
            LOG_WARN("Trade {} expired with no bars for {} up to {}, closing at entry",
                     trade.id, trade.instrument, trade.expiry_date);
        } else {
            exit_price = history.back().close;
        }
        closeTrade(trade, ExitCheck{TradeStatus::CLOSED_EXPIRY, exit_price, "expired"}, trade.expiry_date);
    }
    return dirty || trade.status != TradeStatus::OPEN;
}

MonitorReport TradeLifecycleEngine::monitor(const std::string& check_date, const core::IMarketDataSource& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    MonitorReport report;

    core::TradeBook next = book_;
    std::vector<std::size_t> closed_idx;
    std::vector<std::size_t> cancelled_idx;
    bool dirty = false;

    auto cancel = [&](core::Trade& trade, std::size_t i, const std::string& reason, const std::string& date) {
        const auto transition = core::execution::TradeLifecycleStateMachine::transition(trade.status, "cancel");
        trade.status = transition.status;
        trade.exit_reason = reason;
        trade.exit_date = date;
        trade.updated_at_ms = clock_();
        cancelled_idx.push_back(i);
        report.cancelled++;
        dirty = true;
    };

    for (std::size_t i = 0; i < next.trades.size(); ++i) {
        auto& trade = next.trades[i];
        if (trade.status != TradeStatus::OPEN) {
            continue;
        }
        report.checked++;

        if (!trade.filled) {
            const auto pending = data.bars(trade.instrument,
                                           utils::DateUtils::addDays(trade.signal_date, 1), check_date);
            const bool missed = pending.empty() ? check_date > trade.expiry_date
                                                : pending.front().date > trade.expiry_date;
            if (missed) {
                cancel(trade, i, "expired_before_fill", trade.expiry_date);
                continue;
            }
            if (pending.empty()) {
                continue;
            }
            const DailyBar& fill_bar = pending.front();

            std::vector<risk::OpenPositionView> others;
            for (const auto& t : next.trades) {
                if (t.status == TradeStatus::OPEN && t.id != trade.id) {
                    others.push_back(risk::OpenPositionView{t.sector, t.horizon_days});
                }
            }
            const auto check = risk_.validateEntry(trade.sector, trade.horizon_days, others);
            if (!check.allowed) {
                cancel(trade, i, check.reason, fill_bar.date);
                continue;
            }

            trade.filled = true;
            trade.entry_price = fill_bar.open;
            trade.entry_date = fill_bar.date;
            setLevels(trade);
            trade.updated_at_ms = clock_();
            report.filled++;
            dirty = true;
        }

        if (advance(trade, check_date, data)) {
            dirty = true;
        }
        if (trade.status != TradeStatus::OPEN) {
            closed_idx.push_back(i);
            report.closed++;
            report.closed_ids.push_back(trade.id);
        }
    }

    std::vector<std::size_t> shadow_closed_idx;
    for (std::size_t i = 0; i < next.shadow_trades.size(); ++i) {
        auto& shadow = next.shadow_trades[i];
        if (shadow.status != TradeStatus::OPEN) {
            continue;
        }
        if (advance(shadow, check_date, data)) {
            dirty = true;
        }
        if (shadow.status != TradeStatus::OPEN) {
            shadow_closed_idx.push_back(i);
            report.shadow_closed++;
        }
    }

    if (!dirty) {
        return report;
    }
    commit(std::move(next));

    for (const auto i : cancelled_idx) {
        const auto& trade = book_.trades[i];
        LOG_WARN("Trade {} cancelled before fill: {}", trade.id, trade.exit_reason);
        journal(core::JournalEventType::TRADE_CANCELLED, trade, {{"reason", trade.exit_reason}});
    }
    for (const auto i : shadow_closed_idx) {
        const auto& shadow = book_.shadow_trades[i];
        LOG_INFO("Shadow {} closed: {} {} {} -> {:+.2f}%", shadow.id, shadow.instrument,
                 shadow.horizon_label, shadow.exit_reason, shadow.return_pct);
    }
    for (const auto i : closed_idx) {
        const core::Trade trade = book_.trades[i];
        LOG_INFO("Trade {} closed: {} {} {} at {:.2f} -> {:+.2f}% ({:+.0f})",
                 trade.id, trade.instrument, toString(trade.status), trade.exit_date,
                 trade.exit_price, trade.return_pct, trade.pnl);
        Logger::getInstance().logTrade(trade.id, trade.instrument, toString(trade.direction),
                                       trade.horizon_label, trade.exit_reason, trade.entry_price,
                                       trade.exit_price, trade.return_pct, trade.pnl);
        journal(core::JournalEventType::TRADE_CLOSED, trade, {
            {"status", toString(trade.status)},
            {"exit_reason", trade.exit_reason},
            {"exit_price", trade.exit_price},
            {"return_pct", trade.return_pct},
            {"pnl", trade.pnl}});
        applyClose(trade);
        pending_outcomes_.push_back(toOutcome(trade));
    }
    return report;
}

int TradeLifecycleEngine::reconcile() {
    std::lock_guard<std::mutex> lock(mutex_);
    int reapplied = 0;

    std::set<std::string> queued;
    for (const auto& o : pending_outcomes_) {
        queued.insert(o.trade_id);
    }

    for (const auto& trade : book_.trades) {
        if (!isTerminal(trade.status) || trade.status == TradeStatus::CANCELLED) {
            continue;
        }
        if (!risk_.isApplied(trade.id)) {
            LOG_WARN("Trade {} closed but missing from risk state, re-applying", trade.id);
            applyClose(trade);
            ++reapplied;
        }
        if (!trade.feedback_recorded && queued.insert(trade.id).second) {
            pending_outcomes_.push_back(toOutcome(trade));
        }
    }
    return reapplied;
}

std::vector<OutcomeRecord> TradeLifecycleEngine::drainOutcomes() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutcomeRecord> out;
    out.swap(pending_outcomes_);
    return out;
}

void TradeLifecycleEngine::markFeedbackRecorded(const std::vector<std::string>& trade_ids) {
    if (trade_ids.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const std::set<std::string> ids(trade_ids.begin(), trade_ids.end());
    core::TradeBook next = book_;
    bool changed = false;
    for (auto& t : next.trades) {
        if (ids.count(t.id) > 0 && !t.feedback_recorded) {
            t.feedback_recorded = true;
            changed = true;
        }
    }
    if (changed) {
        commit(std::move(next));
    }
}

std::vector<core::Trade> TradeLifecycleEngine::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return book_.trades;
}

std::vector<core::Trade> TradeLifecycleEngine::openTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::Trade> out;
    for (const auto& t : book_.trades) {
        if (t.status == TradeStatus::OPEN) {
            out.push_back(t);
        }
    }
    return out;
}

std::vector<core::Trade> TradeLifecycleEngine::shadowTrades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return book_.shadow_trades;
}

std::optional<core::Trade> TradeLifecycleEngine::find(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& t : book_.trades) {
        if (t.id == trade_id) {
            return t;
        }
    }
    return std::nullopt;
}

std::vector<risk::OpenPositionView> TradeLifecycleEngine::openPositions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return openPositionsLocked("");
}

bool TradeLifecycleEngine::wasScanned(const std::string& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return book_.scanned_dates.count(date) > 0;
}

void TradeLifecycleEngine::markScanned(const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (book_.scanned_dates.count(date) > 0) {
        return;
    }
    core::TradeBook next = book_;
    next.scanned_dates.insert(date);
    commit(std::move(next));
}

std::string TradeLifecycleEngine::lastScanDate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return book_.scanned_dates.empty() ? std::string() : *book_.scanned_dates.rbegin();
}

} // namespace engine
} // namespace patternedge
