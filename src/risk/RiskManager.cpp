#include "risk/RiskManager.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/Types.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace patternedge {
namespace risk {

namespace {
double lossPct(double pnl, double base) {
    if (pnl >= 0.0 || base <= 0.0) {
        return 0.0;
    }
    return -pnl / base * 100.0;
}
}

std::string toString(Breaker breaker) {
    switch (breaker) {
        case Breaker::DAILY_LOSS: return "daily_loss";
        case Breaker::CONSECUTIVE_LOSSES: return "consecutive_losses";
        case Breaker::DRAWDOWN: return "drawdown";
        case Breaker::DAILY_TRADES: return "daily_trades";
        case Breaker::MONTHLY_LOSS: return "monthly_loss";
        case Breaker::COOLDOWN: return "cooldown";
    }
    return "unknown";
}

RiskManager::RiskManager(const engine::RiskConfig& config,
                         std::shared_ptr<core::IRiskStateStore> store,
                         Clock clock,
                         int primary_horizon)
    : config_(config)
    , store_(std::move(store))
    , clock_(std::move(clock))
    , primary_horizon_(primary_horizon > 0 ? primary_horizon : 5)
{
    if (!clock_) {
        clock_ = getCurrentTimestampMs;
    }

    std::optional<RiskState> loaded;
    if (store_) {
        loaded = store_->load();
    }

    if (loaded) {
        state_ = *loaded;
        if (std::fabs(state_.initial_capital - config_.initial_capital) > 1e-9) {
            LOG_WARN("Risk state initial capital {:.0f} differs from config {:.0f}, keeping stored value",
                     state_.initial_capital, config_.initial_capital);
        }
        LOG_INFO("Risk state loaded (v{}): capital {:.0f}, peak {:.0f}, {} applied trades",
                 state_.version, state_.capital, state_.peak_capital, state_.applied_trade_ids.size());
    } else {
        state_ = RiskState::initial(config_.initial_capital, utils::DateUtils::dateFromMs(now()));
        LOG_INFO("RiskManager initialized - initial capital {:.0f}", config_.initial_capital);
    }
}

long long RiskManager::now() const {
    return clock_();
}

RiskState RiskManager::rollover(const RiskState& state, long long now_ms,
                                const engine::RiskConfig& config) {
    RiskState s = state;
    const std::string today = utils::DateUtils::dateFromMs(now_ms);

    if (s.current_date != today) {
        s.current_date = today;
        s.day_start_capital = s.capital;
        s.trades_today = 0;
        s.daily_pnl = 0.0;
        s.breakers.daily_loss = false;
        s.breakers.daily_trades = false;
    }

    const std::string month = utils::DateUtils::monthOf(today);
    if (s.current_month != month) {
        s.current_month = month;
        s.monthly_pnl = 0.0;
        s.monthly_trades = 0;
        s.breakers.monthly_loss = false;
    }

    if (s.cooldown_until_ms > 0 && now_ms >= s.cooldown_until_ms) {
        s.cooldown_until_ms = 0;
        if (s.breakers.consecutive_losses) {
            s.breakers.consecutive_losses = false;
            s.consecutive_losses = 0;
        }
        // drawdown stays latched until the account is back under the limit
        if (s.breakers.drawdown && s.drawdownPct() < config.max_drawdown_pct) {
            s.breakers.drawdown = false;
        }
    }
    return s;
}

RiskDecision RiskManager::evaluateState(const RiskState& state, long long now_ms,
                                        const engine::RiskConfig& config) {
    const RiskState s = rollover(state, now_ms, config);
    RiskDecision decision;

    auto add = [&decision](Breaker breaker, double value, double threshold, std::string message) {
        decision.reasons.push_back(BreakerTrip{breaker, value, threshold, std::move(message)});
    };

    if (s.breakers.drawdown) {
        add(Breaker::DRAWDOWN, s.drawdownPct(), config.max_drawdown_pct, "drawdown limit reached");
    }
    if (s.breakers.daily_loss) {
        add(Breaker::DAILY_LOSS, lossPct(s.daily_pnl, s.day_start_capital),
            config.max_daily_loss_pct, "daily loss limit reached");
    }
    if (s.breakers.daily_trades) {
        add(Breaker::DAILY_TRADES, s.trades_today, config.max_daily_trades, "daily trade limit reached");
    }
    if (s.breakers.consecutive_losses) {
        add(Breaker::CONSECUTIVE_LOSSES, s.consecutive_losses, config.max_consecutive_losses,
            "consecutive loss limit reached");
    }
    if (s.breakers.monthly_loss) {
        add(Breaker::MONTHLY_LOSS, lossPct(s.monthly_pnl, s.initial_capital),
            config.max_monthly_loss_pct, "monthly loss limit reached");
    }
    if (s.cooldown_until_ms > 0 && now_ms < s.cooldown_until_ms) {
        const double remaining_min = static_cast<double>(s.cooldown_until_ms - now_ms) / 60000.0;
        add(Breaker::COOLDOWN, remaining_min, config.cooldown_minutes, "cooldown active");
    }

    decision.allowed = decision.reasons.empty();
    return decision;
}

bool RiskManager::canTrade() const {
    return evaluate().allowed;
}

RiskDecision RiskManager::evaluate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evaluateState(state_, now(), config_);
}

RiskState RiskManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rollover(state_, now(), config_);
}

bool RiskManager::isApplied(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.applied_trade_ids.count(trade_id) > 0;
}

CloseResult RiskManager::recordTradeClose(const TradeClose& close) {
    std::lock_guard<std::mutex> lock(mutex_);

    CloseResult result;
    if (state_.applied_trade_ids.count(close.trade_id) > 0) {
        LOG_INFO("Trade {} already applied to risk state, skipping", close.trade_id);
        return result;
    }

    const long long ts = now();
    RiskState next = rollover(state_, ts, config_);
    const BreakerFlags before = next.breakers;

    next.capital += close.pnl;
    next.realized_pnl_total += close.pnl;
    next.daily_pnl += close.pnl;
    next.monthly_pnl += close.pnl;
    next.trades_today++;
    next.monthly_trades++;
    next.total_trades++;
    if (close.pnl > 0.0) {
        next.total_wins++;
    }
    if (close.pnl < 0.0) {
        next.consecutive_losses++;
    } else {
        next.consecutive_losses = 0;
    }
    next.peak_capital = (std::max)(next.peak_capital, next.capital);

    const long long cooldown_until = ts + static_cast<long long>(config_.cooldown_minutes) * 60000LL;
    auto trip = [&](bool& flag, bool was_on, Breaker breaker, double value, double threshold,
                    bool with_cooldown) {
        flag = true;
        if (with_cooldown) {
            next.cooldown_until_ms = (std::max)(next.cooldown_until_ms, cooldown_until);
        }
        if (!was_on) {
            result.tripped.push_back(BreakerTrip{
                breaker, value, threshold, toString(breaker) + " breaker tripped"});
        }
    };

    const double daily_loss = lossPct(next.daily_pnl, next.day_start_capital);
    if (daily_loss >= config_.max_daily_loss_pct) {
        trip(next.breakers.daily_loss, before.daily_loss, Breaker::DAILY_LOSS,
             daily_loss, config_.max_daily_loss_pct, true);
    }
    if (next.consecutive_losses >= config_.max_consecutive_losses) {
        trip(next.breakers.consecutive_losses, before.consecutive_losses, Breaker::CONSECUTIVE_LOSSES,
             next.consecutive_losses, config_.max_consecutive_losses, true);
    }
    const double drawdown = next.drawdownPct();
    if (drawdown >= config_.max_drawdown_pct) {
        trip(next.breakers.drawdown, before.drawdown, Breaker::DRAWDOWN,
             drawdown, config_.max_drawdown_pct, true);
    }
    if (next.trades_today >= config_.max_daily_trades) {
        trip(next.breakers.daily_trades, before.daily_trades, Breaker::DAILY_TRADES,
             next.trades_today, config_.max_daily_trades, false);
    }
    const double monthly_loss = lossPct(next.monthly_pnl, next.initial_capital);
    if (monthly_loss >= config_.max_monthly_loss_pct) {
        trip(next.breakers.monthly_loss, before.monthly_loss, Breaker::MONTHLY_LOSS,
             monthly_loss, config_.max_monthly_loss_pct, true);
    }

    next.applied_trade_ids.insert(close.trade_id);
    ClosedTradeRecord record;
    record.trade_id = close.trade_id;
    record.instrument = close.instrument;
    record.sector = close.sector;
    record.horizon_days = close.horizon_days;
    record.pnl = close.pnl;
    record.return_pct = close.return_pct;
    record.exit_date = close.exit_date;
    record.recorded_at_ms = ts;
    next.recent_closes.push_back(std::move(record));
    const auto limit = static_cast<std::size_t>((std::max)(1, config_.recent_history_limit));
    if (next.recent_closes.size() > limit) {
        next.recent_closes.erase(next.recent_closes.begin(),
                                 next.recent_closes.end() - static_cast<std::ptrdiff_t>(limit));
    }
    next.updated_at_ms = ts;

    persist(next);
    state_ = std::move(next);
    result.applied = true;

    LOG_INFO("Trade close applied: {} pnl {:+.0f} | capital {:.0f} | daily {:+.0f} | streak {}",
             close.trade_id, close.pnl, state_.capital, state_.daily_pnl, state_.consecutive_losses);
    for (const auto& t : result.tripped) {
        LOG_ERROR("Circuit breaker {} tripped: {:.2f} >= {:.2f}", toString(t.breaker), t.value, t.threshold);
    }
    return result;
}

// Caller holds mutex_. Bumps next.version; state_ is untouched on failure.
void RiskManager::persist(RiskState& next) {
    const std::uint64_t expected = state_.version;
    next.version = expected + 1;
    if (!store_) {
        return;
    }
    if (!store_->save(next, expected)) {
        throw PersistenceError("failed to persist risk state v" + std::to_string(next.version));
    }
}

EntryCheck RiskManager::checkSectorLimit(const std::string& sector,
                                                  const std::vector<OpenPositionView>& open) const {
    EntryCheck check;
    const std::string key = sector.empty() ? "unknown" : sector;
    const auto same = std::count_if(open.begin(), open.end(), [&key](const OpenPositionView& p) {
        return (p.sector.empty() ? std::string("unknown") : p.sector) == key;
    });
    if (same >= config_.max_positions_per_sector) {
        check.reason = "sector_limit: " + key + " has " + std::to_string(same) + " open positions (max " +
                       std::to_string(config_.max_positions_per_sector) + ")";
        return check;
    }
    check.allowed = true;
    return check;
}

EntryCheck RiskManager::checkHorizonLimit(int horizon_days,
                                                   const std::vector<OpenPositionView>& open) const {
    EntryCheck check;
    const double base = static_cast<double>(primary_horizon_);
    double weight = 0.0;
    for (const auto& p : open) {
        weight += static_cast<double>(p.horizon_days) / base;
    }
    const double next_weight = weight + static_cast<double>(horizon_days) / base;
    if (next_weight > config_.max_concurrent_positions + 1e-9) {
        char buf[160];
        std::snprintf(buf, sizeof(buf), "horizon_limit: weighted positions %.2f + %.2f > %.2f",
                      weight, static_cast<double>(horizon_days) / base, config_.max_concurrent_positions);
        check.reason = buf;
        return check;
    }
    check.allowed = true;
    return check;
}

EntryCheck RiskManager::validateEntry(const std::string& sector, int horizon_days,
                                               const std::vector<OpenPositionView>& open) const {
    const auto decision = evaluate();
    if (!decision.allowed) {
        EntryCheck check;
        check.reason = "circuit_breaker: " + toString(decision.reasons.front().breaker);
        return check;
    }
    auto sector_check = checkSectorLimit(sector, open);
    if (!sector_check.allowed) {
        return sector_check;
    }
    return checkHorizonLimit(horizon_days, open);
}

bool RiskManager::resetBreakers(bool confirm) {
    if (!confirm) {
        LOG_WARN("resetBreakers called without confirmation, ignored");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const long long ts = now();
    RiskState next = rollover(state_, ts, config_);
    next.breakers = BreakerFlags{};
    next.cooldown_until_ms = 0;
    next.consecutive_losses = 0;
    next.updated_at_ms = ts;

    persist(next);
    state_ = std::move(next);
    LOG_WARN("Circuit breakers manually reset");
    return true;
}

} // namespace risk
} // namespace patternedge
