#include "core/orchestration/TradingCycleCoordinator.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace patternedge {
namespace core {

namespace {
bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}
} // namespace

TradingCycleCoordinator::TradingCycleCoordinator(
    engine::EngineConfig config,
    std::shared_ptr<const analytics::TieredPredictor> predictor,
    std::shared_ptr<engine::FeedbackStore> feedback,
    std::shared_ptr<const analytics::RegimeDetector> regime,
    std::shared_ptr<risk::RiskManager> risk,
    std::shared_ptr<engine::TradeLifecycleEngine> lifecycle,
    std::shared_ptr<const IMarketDataSource> market_data,
    std::shared_ptr<IEventJournal> journal
)
    : config_(std::move(config))
    , predictor_(std::move(predictor))
    , feedback_(std::move(feedback))
    , regime_(std::move(regime))
    , risk_(std::move(risk))
    , lifecycle_(std::move(lifecycle))
    , market_data_(std::move(market_data))
    , journal_(std::move(journal))
    , sizer_(config_.sizing) {}

void TradingCycleCoordinator::journal(JournalEventType type, const std::string& instrument,
                                      const std::string& entity_id, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    JournalEvent event;
    event.ts_ms = getCurrentTimestampMs();
    event.type = type;
    event.instrument = instrument;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("journal append failed ({})", entity_id);
    }
}

int TradingCycleCoordinator::reconcile() {
    const int n = lifecycle_->reconcile();
    if (n > 0) {
        LOG_WARN("Reconciled {} closed trades into the risk state", n);
    }
    return n;
}

int TradingCycleCoordinator::catchUp(const std::string& date) {
    const std::string last_scan = lifecycle_->lastScanDate();
    if (last_scan.empty()) {
        LOG_INFO("First run - no catch-up needed");
        return 0;
    }
    const std::string yesterday = utils::DateUtils::addDays(date, -1);
    if (yesterday <= last_scan) {
        return 0;
    }

    std::vector<std::string> missed = utils::DateUtils::tradingDaysAfter(last_scan, yesterday);
    const std::string oldest = utils::DateUtils::addDays(date, -config_.lifecycle.max_catch_up_days);
    missed.erase(std::remove_if(missed.begin(), missed.end(),
                                [&oldest](const std::string& d) { return d < oldest; }),
                 missed.end());
    if (missed.empty()) {
        LOG_INFO("No missed trading days");
        return 0;
    }

    LOG_INFO("CATCH-UP: {} missed days ({} to {})", missed.size(), missed.front(), missed.back());
    for (const auto& day : missed) {
        monitor(day);
    }
    return static_cast<int>(missed.size());
}

engine::MonitorReport TradingCycleCoordinator::monitor(const std::string& date) {
    const auto report = lifecycle_->monitor(date, *market_data_);
    if (report.checked > 0) {
        LOG_INFO("Monitor {}: {} open checked, {} filled, {} cancelled, {} closed",
                 date, report.checked, report.filled, report.cancelled, report.closed);
    }
    return report;
}

std::vector<HorizonPlan> TradingCycleCoordinator::planHorizons(const analytics::Prediction& prediction,
                                                               const analytics::Observation& observation) const {
    const auto& pc = config_.predictor;
    const double close = observation.close;
    const double atr = observation.atr > 0.0 ? observation.atr : close * 0.015;

    bool structural = false;
    for (const auto& p : observation.patterns) {
        if (predictor_->isTradeablePattern(p) && contains(pc.structural_patterns, p)) {
            structural = true;
        }
    }
    const double mult = structural ? pc.structural_sl_multiplier : pc.standard_sl_multiplier;

    std::vector<HorizonPlan> plans;
    if (close <= 0.0) {
        return plans;
    }
    for (const auto& profile : config_.lifecycle.horizons) {
        HorizonPlan plan;
        plan.horizon_days = profile.days;
        plan.horizon_label = horizonLabel(profile.days);

        const auto* hs = prediction.horizon(profile.days);
        plan.direction = (hs && hs->direction != Direction::NEUTRAL) ? hs->direction : prediction.direction;

        const double raw_sl = profile.sl_multiplier_scale * mult * atr / close * 100.0;
        plan.sl_pct = (std::max)(pc.sl_floor_pct, (std::min)(profile.sl_cap_pct, raw_sl));
        const double avg = hs ? std::fabs(hs->avg_return) : 0.0;
        plan.target_pct = avg > 0.0 ? (std::max)(plan.sl_pct * profile.rr_min, avg)
                                    : plan.sl_pct * profile.rr_min;
        plan.rr_ratio = plan.sl_pct > 0.0 ? plan.target_pct / plan.sl_pct : 0.0;
        plans.push_back(plan);
    }
    return plans;
}

std::vector<ScanDecision> TradingCycleCoordinator::evaluate(const std::string& date,
                                                            const analytics::Observation& obs,
                                                            const analytics::Prediction& prediction,
                                                            const engine::FeedbackSnapshot* feedback,
                                                            bool dry_run,
                                                            std::vector<ShadowCandidate>* shadows) {
    const auto& lc = config_.lifecycle;
    std::vector<std::string> tradeable;
    for (const auto& p : obs.patterns) {
        if (predictor_->isTradeablePattern(p)) {
            tradeable.push_back(p);
        }
    }

    std::vector<ScanDecision> out;
    for (const auto& plan : planHorizons(prediction, obs)) {
        ScanDecision d;
        d.instrument = obs.instrument;
        d.pattern = prediction.pattern;
        d.plan = plan;
        d.confidence_level = prediction.confidence_level;

        // Horizon specific paper win rate overrides the blended one
        d.win_rate = prediction.win_rate;
        if (feedback) {
            if (const auto hz = predictor_->blender().horizonWinRate(*feedback, tradeable, obs.trend, plan.horizon_label)) {
                d.win_rate = *hz;
            }
        }

        double wr_threshold = lc.min_win_rate;
        double rr_threshold = lc.min_rr_ratio;
        if (feedback) {
            for (const auto& p : tradeable) {
                const auto* hz_filter = feedback->filter(engine::AdjustmentKey::forHorizon(p, plan.horizon_label));
                const auto* pat_filter = feedback->filter(engine::AdjustmentKey::forPattern(p));
                const auto* sec_filter = feedback->filter(engine::AdjustmentKey::forSector(p, obs.sector));

                if (hz_filter && hz_filter->action == engine::FilterAction::REJECT) {
                    d.reasons.push_back("horizon penalty: " + hz_filter->reason);
                } else if (pat_filter && pat_filter->action == engine::FilterAction::REJECT) {
                    d.reasons.push_back("pattern penalty: " + pat_filter->reason);
                }
                if (sec_filter && sec_filter->action == engine::FilterAction::REJECT) {
                    d.reasons.push_back("sector penalty: " + sec_filter->reason);
                }

                if (hz_filter && hz_filter->action == engine::FilterAction::RELAX) {
                    wr_threshold = (std::max)(lc.horizon_boost_win_rate_floor, wr_threshold - lc.horizon_boost_win_rate_step);
                    rr_threshold = (std::max)(lc.horizon_boost_rr_floor, rr_threshold - lc.horizon_boost_rr_step);
                } else if (pat_filter && pat_filter->action == engine::FilterAction::RELAX) {
                    wr_threshold = (std::max)(lc.pattern_boost_win_rate_floor, wr_threshold - lc.pattern_boost_win_rate_step);
                    rr_threshold = (std::max)(lc.pattern_boost_rr_floor, rr_threshold - lc.pattern_boost_rr_step);
                }
            }
        }

        if (d.win_rate < wr_threshold) {
            d.reasons.push_back("low win rate");
        }
        if (lc.reject_low_confidence && d.confidence_level == ConfidenceLevel::LOW) {
            d.reasons.push_back("low confidence");
        }
        if (plan.rr_ratio < rr_threshold) {
            d.reasons.push_back("low R:R ratio");
        }

        if (d.reasons.empty()) {
            risk::SizingInput input;
            input.win_rate_pct = d.win_rate;
            input.profit_factor = prediction.profit_factor;
            input.stop_loss_pct = plan.sl_pct;
            input.confidence = d.confidence_level;
            input.horizon_days = plan.horizon_days;
            input.sector = obs.sector;
            input.regime_scale = regime_ ? regime_->horizonScale(plan.horizon_label, date) : 1.0;
            input.capital = risk_->state().capital;
            d.sizing = sizer_.size(input);
            if (d.sizing.position_pct <= 0.0) {
                d.reasons.push_back("sizing: " + d.sizing.reason);
            }
        }

        engine::TradeSignal signal;
        signal.instrument = obs.instrument;
        signal.sector = obs.sector;
        signal.direction = plan.direction;
        signal.patterns = tradeable;
        signal.horizon_days = plan.horizon_days;
        signal.signal_date = date;
        signal.signal_close = obs.close;
        signal.sl_pct = plan.sl_pct;
        signal.target_pct = plan.target_pct;
        signal.rr_ratio = plan.rr_ratio;
        signal.position_pct = d.sizing.position_pct;
        signal.position_value = d.sizing.position_value;
        signal.predicted_win_rate = d.win_rate;
        signal.predicted_pf = prediction.profit_factor;
        signal.confidence = prediction.confidence;
        signal.confidence_level = prediction.confidence_level;
        signal.tier = prediction.tier;
        signal.n_matches = prediction.n_matches;
        signal.trend = obs.trend;
        signal.volume_ratio = obs.volume_ratio;
        signal.regime = regime_ ? analytics::toString(regime_->detect(date).regime) : std::string();

        if (!d.reasons.empty()) {
            if (!dry_run) {
                journal(JournalEventType::SIGNAL_REJECTED, obs.instrument, plan.horizon_label, {
                    {"date", date}, {"pattern", prediction.pattern}, {"reasons", d.reasons}});
                if (shadows) {
                    shadows->push_back(ShadowCandidate{signal, d.reasons, out.size()});
                }
            }
            out.push_back(std::move(d));
            continue;
        }

        if (dry_run) {
            d.accepted = true;
            out.push_back(std::move(d));
            continue;
        }

        const auto result = lifecycle_->accept(signal);
        d.trade_id = result.trade_id;
        if (result.status == engine::AcceptStatus::ACCEPTED || result.status == engine::AcceptStatus::PENDING_FILL) {
            d.accepted = true;
            journal(JournalEventType::SIGNAL_ACCEPTED, obs.instrument, result.trade_id, {
                {"date", date}, {"pattern", prediction.pattern}, {"horizon", plan.horizon_label},
                {"win_rate", d.win_rate}, {"position_pct", d.sizing.position_pct}});
        } else {
            d.reasons.push_back(engine::toString(result.status) + (result.reason.empty() ? "" : ": " + result.reason));
            if (result.status != engine::AcceptStatus::DUPLICATE) {
                journal(JournalEventType::SIGNAL_REJECTED, obs.instrument, plan.horizon_label, {
                    {"date", date}, {"pattern", prediction.pattern}, {"reasons", d.reasons}});
                if (shadows) {
                    shadows->push_back(ShadowCandidate{signal, d.reasons, out.size()});
                }
            }
        }
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<ScanDecision> TradingCycleCoordinator::scan(const std::string& date,
                                                        const std::vector<analytics::Observation>& live,
                                                        bool dry_run) {
    std::vector<ScanDecision> decisions;
    if (!dry_run && lifecycle_->wasScanned(date)) {
        LOG_INFO("Already scanned {} - skip", date);
        return decisions;
    }

    const auto decision = risk_->evaluate();
    if (!decision.allowed) {
        for (const auto& reason : decision.reasons) {
            LOG_WARN("Trading blocked on {}: {} ({:.2f} / {:.2f})", date,
                     risk::toString(reason.breaker), reason.value, reason.threshold);
        }
    }

    const auto snapshot = feedback_ ? feedback_->usableSnapshot(date) : nullptr;

    std::vector<analytics::PredictionQuery> queries;
    queries.reserve(live.size());
    for (const auto& obs : live) {
        analytics::PredictionQuery q;
        q.patterns = obs.patterns;
        q.context.timeframe = obs.timeframe;
        q.context.trend = obs.trend;
        q.context.volatility_zone = obs.volatility_zone;
        q.context.price_position = obs.price_position;
        q.context.market_regime = obs.market_regime;
        q.context.instrument = obs.instrument;
        q.context.sector = obs.sector;
        queries.push_back(std::move(q));
    }
    const auto predictions = predictor_->predictBatch(queries, snapshot.get(), config_.storage.prediction_workers);

    int n_predictions = 0;
    std::vector<ShadowCandidate> shadow_candidates;
    for (std::size_t i = 0; i < live.size(); ++i) {
        const auto& prediction = predictions[i];
        if (!prediction || prediction->direction == Direction::NEUTRAL) {
            continue;
        }
        ++n_predictions;
        if (!decision.allowed && !dry_run) {
            continue;
        }
        const std::size_t offset = decisions.size();
        const std::size_t first_candidate = shadow_candidates.size();
        auto part = evaluate(date, live[i], *prediction, snapshot.get(), dry_run,
                             dry_run ? nullptr : &shadow_candidates);
        for (std::size_t c = first_candidate; c < shadow_candidates.size(); ++c) {
            shadow_candidates[c].decision_index += offset;
        }
        decisions.insert(decisions.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    trackShadows(shadow_candidates, decisions);

    const auto accepted = std::count_if(decisions.begin(), decisions.end(),
                                        [](const ScanDecision& d) { return d.accepted; });
    LOG_INFO("SCAN {}: {} observations, {} directional predictions, {} signals, {} accepted{}",
             date, live.size(), n_predictions, decisions.size(), accepted, dry_run ? " (dry run)" : "");

    if (!dry_run) {
        lifecycle_->markScanned(date);
    }
    return decisions;
}

void TradingCycleCoordinator::trackShadows(const std::vector<ShadowCandidate>& candidates,
                                           std::vector<ScanDecision>& decisions) {
    const int pct = config_.lifecycle.shadow_sample_pct;
    if (candidates.empty() || pct <= 0) {
        return;
    }
    const std::size_t n = candidates.size();
    const std::size_t k = (std::min)(n, (std::max)(std::size_t{1}, n * static_cast<std::size_t>(pct) / 100));

    int tracked = 0;
    for (std::size_t i = 0; i < k; ++i) {
        const auto& candidate = candidates[i * n / k];
        if (lifecycle_->recordShadow(candidate.signal, candidate.reasons)) {
            decisions[candidate.decision_index].shadow = true;
            ++tracked;
        }
    }
    if (tracked > 0) {
        LOG_INFO("SHADOW: tracking {}/{} filtered signals", tracked, n);
    }
}

int TradingCycleCoordinator::flushFeedback(const std::string& date) {
    if (!feedback_) {
        return 0;
    }

    const auto outcomes = lifecycle_->drainOutcomes();
    int added = feedback_->ingest(outcomes, date);

    bool saved = false;
    try {
        saved = feedback_->save();
    } catch (const VersionConflictError& e) {
        LOG_WARN("Feedback changed on disk ({}), reloading and retrying", e.what());
        feedback_->load();
        added = feedback_->ingest(outcomes, date);
        saved = feedback_->save();
    }
    if (!saved) {
        LOG_ERROR("Feedback document not saved, outcomes will be re-queued next session");
        return added;
    }

    std::vector<std::string> ids;
    for (const auto& o : outcomes) {
        ids.push_back(o.trade_id);
    }
    lifecycle_->markFeedbackRecorded(ids);

    if (added > 0) {
        journal(JournalEventType::OUTCOMES_INGESTED, "", date, {
            {"added", added}, {"total", feedback_->snapshot()->outcomes.size()},
            {"rules", feedback_->snapshot()->rules.size()}});
    }
    return added;
}

SessionReport TradingCycleCoordinator::runSession(const std::string& date,
                                                  const std::vector<analytics::Observation>& live) {
    SessionReport report;
    report.date = date;
    report.observations = static_cast<int>(live.size());

    LOG_INFO("============================================================");
    LOG_INFO("SESSION {} STARTED", date);

    report.reconciled = reconcile();
    report.catch_up_days = catchUp(date);

    if (regime_) {
        const auto analysis = regime_->detect(date);
        report.regime = analytics::toString(analysis.regime);
        LOG_INFO("Regime {}: {} (scale {:.2f})", date, report.regime, analysis.scale);
        journal(JournalEventType::REGIME_DETECTED, config_.storage.index_instrument, date, {
            {"regime", report.regime}, {"scale", analysis.scale},
            {"trend", analysis.trend}, {"vol_level", analysis.vol_level}});
    }

    if (utils::DateUtils::isTradingDay(date)) {
        if (!lifecycle_->wasScanned(date)) {
            const auto decisions = scan(date, live, false);
            report.scanned = true;
            report.signals = static_cast<int>(decisions.size());
            for (const auto& d : decisions) {
                if (d.shadow) {
                    report.shadows_tracked++;
                }
                if (d.accepted) {
                    report.accepted++;
                } else if (!d.reasons.empty() && d.reasons.back().rfind("duplicate", 0) == 0) {
                    report.duplicates++;
                } else {
                    report.rejected++;
                }
            }
        } else {
            LOG_INFO("Already scanned {} - skip", date);
        }
    } else {
        LOG_INFO("{} is not a trading day - skip scan", date);
    }

    const auto monitored = monitor(date);
    report.filled = monitored.filled;
    report.cancelled = monitored.cancelled;
    report.closed = monitored.closed;
    report.shadows_closed = monitored.shadow_closed;

    report.outcomes_ingested = flushFeedback(date);

    report.daily = engine::PerformanceStore::dailySummary(lifecycle_->trades(), date);
    const auto& daily = report.daily;
    LOG_INFO("DAILY {}: {} opened, {} closed ({}W/{}L, {} expired), return {:+.2f}%, win rate {:.1f}%",
             date, daily.trades_opened, daily.trades_closed, daily.wins, daily.losses,
             daily.expired_wins + daily.expired_losses, daily.total_return_pct, daily.win_rate);
    if (daily.trades_closed > 0) {
        LOG_INFO("DAILY {}: best {} | worst {}", date, daily.best_trade, daily.worst_trade);
    }

    LOG_INFO("SESSION {} COMPLETE: {} signals, {} accepted, {} closed, {} outcomes ingested",
             date, report.signals, report.accepted, report.closed, report.outcomes_ingested);
    return report;
}

} // namespace core
} // namespace patternedge
