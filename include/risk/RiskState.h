#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace patternedge {
namespace risk {

struct BreakerFlags {
    bool daily_loss = false;
    bool consecutive_losses = false;
    bool drawdown = false;
    bool daily_trades = false;
    bool monthly_loss = false;

    bool any() const {
        return daily_loss || consecutive_losses || drawdown || daily_trades || monthly_loss;
    }
};

struct ClosedTradeRecord {
    std::string trade_id;
    std::string instrument;
    std::string sector;
    int horizon_days = 0;
    double pnl = 0.0;
    double return_pct = 0.0;
    std::string exit_date;
    long long recorded_at_ms = 0;
};

// Persistent account-risk state. One logical writer (RiskManager).
struct RiskState {
    std::uint64_t version = 0;
    double initial_capital = 0.0;
    double capital = 0.0;
    double peak_capital = 0.0;
    double realized_pnl_total = 0.0;

    std::string current_date;
    double day_start_capital = 0.0;
    int trades_today = 0;
    double daily_pnl = 0.0;

    std::string current_month;
    double monthly_pnl = 0.0;
    int monthly_trades = 0;

    int consecutive_losses = 0;
    int total_trades = 0;
    int total_wins = 0;

    BreakerFlags breakers;
    long long cooldown_until_ms = 0;    // 0 = no cooldown

    std::set<std::string> applied_trade_ids;
    std::vector<ClosedTradeRecord> recent_closes;
    long long updated_at_ms = 0;

    double drawdownPct() const {
        return peak_capital > 0.0 ? (peak_capital - capital) / peak_capital * 100.0 : 0.0;
    }

    static RiskState initial(double capital, const std::string& today) {
        RiskState s;
        s.initial_capital = capital;
        s.capital = capital;
        s.peak_capital = capital;
        s.day_start_capital = capital;
        s.current_date = today;
        s.current_month = today.size() >= 7 ? today.substr(0, 7) : today;
        return s;
    }
};

} // namespace risk
} // namespace patternedge
