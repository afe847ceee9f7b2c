#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "common/Types.h"

namespace patternedge {
namespace core {

// Paper position opened from an accepted signal
struct Trade {
    std::string id;
    std::string instrument;
    std::string sector;
    Direction direction = Direction::BULLISH;
    std::vector<std::string> patterns;
    int horizon_days = 0;
    std::string horizon_label;
    std::string signal_date;

    // Context at entry, fed back with the outcome
    std::string trend_at_entry;
    double volume_ratio = 1.0;
    std::string regime;

    bool filled = false;
    double signal_price = 0.0;
    double entry_price = 0.0;
    std::string entry_date;
    double sl_price = 0.0;
    double sl_pct = 0.0;
    double target_price = 0.0;
    double target_pct = 0.0;
    double rr_ratio = 0.0;
    std::string expiry_date;

    double position_pct = 0.0;
    double position_value = 0.0;

    double predicted_win_rate = 0.0;
    double predicted_pf = 0.0;
    double confidence = 0.0;
    ConfidenceLevel confidence_level = ConfidenceLevel::LOW;
    Tier tier = Tier::TIER_1;
    int n_matches = 0;

    TradeStatus status = TradeStatus::OPEN;
    double exit_price = 0.0;
    std::string exit_date;
    std::string exit_reason;    // sl_hit | target_hit | expired | <cancel reason>
    double return_pct = 0.0;
    double pnl = 0.0;
    double mfe_pct = 0.0;
    double mae_pct = 0.0;
    std::string last_checked_date;
    bool feedback_recorded = false;
    // Shadow trades only: the filters that turned the signal down
    std::vector<std::string> skip_reasons;

    long long created_at_ms = 0;
    long long updated_at_ms = 0;

    // One trade per (instrument, horizon, signal date)
    std::string dedupKey() const {
        return instrument + "|" + std::to_string(horizon_days) + "|" + signal_date;
    }
};

struct TradeBook {
    std::uint64_t version = 0;
    long long next_id = 1;
    std::vector<Trade> trades;
    std::set<std::string> scanned_dates;

    // Rejected signals followed without capital
    long long next_shadow_id = 1;
    std::vector<Trade> shadow_trades;
};

} // namespace core
} // namespace patternedge
