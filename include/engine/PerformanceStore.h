#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/model/Trade.h"

namespace patternedge {
namespace engine {

struct SegmentPerformance {
    std::string key;
    int closed = 0;
    int wins = 0;
    int losses = 0;
    double total_return_pct = 0.0;
    double win_return_sum = 0.0;
    double loss_return_sum = 0.0;

    double winRate() const {
        return closed > 0 ? static_cast<double>(wins) / closed * 100.0 : 0.0;
    }
    double avgReturn() const {
        return closed > 0 ? total_return_pct / closed : 0.0;
    }
    double avgWin() const {
        return wins > 0 ? win_return_sum / wins : 0.0;
    }
    double avgLoss() const {
        return losses > 0 ? loss_return_sum / losses : 0.0;
    }
    // avg_win * wins / |avg_loss * losses|, 0 without losses
    double profitFactor() const {
        return loss_return_sum < -1e-12 ? win_return_sum / -loss_return_sum : 0.0;
    }
};

struct HorizonShadowStats {
    int closed = 0;
    int wins = 0;
    double win_rate = 0.0;
    std::optional<double> real_win_rate;
    // real minus shadow win rate; positive means the filters add value
    std::optional<double> filter_alpha;
};

struct ShadowComparison {
    int shadow_open = 0;
    SegmentPerformance shadow;
    SegmentPerformance real;
    double filter_alpha = 0.0;
    std::map<std::string, HorizonShadowStats> per_horizon;
};

struct DailySummary {
    std::string date;
    int trades_opened = 0;
    int trades_closed = 0;
    int wins = 0;
    int losses = 0;
    int expired_wins = 0;
    int expired_losses = 0;
    double total_return_pct = 0.0;
    double avg_win_pct = 0.0;
    double avg_loss_pct = 0.0;
    double win_rate = 0.0;
    std::string best_trade;
    std::string worst_trade;
};

// Realized performance of the trade book, split by horizon, pattern and
// instrument, plus the shadow (filtered signal) comparison.
class PerformanceStore {
public:
    void rebuild(const std::vector<core::Trade>& trades, const std::vector<core::Trade>& shadows);

    const SegmentPerformance& overall() const { return overall_; }
    int openTrades() const { return open_; }

    // Ordered by horizon length
    std::vector<SegmentPerformance> byHorizon() const;
    // Ordered by closed trades, most first
    std::vector<SegmentPerformance> byPattern() const;
    std::vector<SegmentPerformance> byInstrument() const;

    const ShadowComparison& shadows() const { return shadow_; }

    static DailySummary dailySummary(const std::vector<core::Trade>& trades, const std::string& date);
    static bool isRealized(const core::Trade& trade);

private:
    SegmentPerformance overall_;
    int open_ = 0;
    std::map<int, SegmentPerformance> by_horizon_;
    std::map<std::string, SegmentPerformance> by_pattern_;
    std::map<std::string, SegmentPerformance> by_instrument_;
    ShadowComparison shadow_;
};

} // namespace engine
} // namespace patternedge
