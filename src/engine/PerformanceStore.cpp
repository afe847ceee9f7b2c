#include "engine/PerformanceStore.h"

#include <algorithm>
#include <cstdio>

namespace patternedge {
namespace engine {
namespace {
void accumulate(SegmentPerformance& s, const core::Trade& trade) {
    s.closed++;
    s.total_return_pct += trade.return_pct;
    if (trade.return_pct > 0.0) {
        s.wins++;
        s.win_return_sum += trade.return_pct;
    } else {
        s.losses++;
        s.loss_return_sum += trade.return_pct;
    }
}

std::string joinPatterns(const std::vector<std::string>& patterns) {
    if (patterns.empty()) {
        return "unknown";
    }
    std::string out;
    for (const auto& p : patterns) {
        if (!out.empty()) {
            out += ",";
        }
        out += p;
    }
    return out;
}

std::vector<SegmentPerformance> sortedByCount(const std::map<std::string, SegmentPerformance>& segments) {
    std::vector<SegmentPerformance> out;
    out.reserve(segments.size());
    for (const auto& entry : segments) {
        out.push_back(entry.second);
    }
    std::stable_sort(out.begin(), out.end(), [](const SegmentPerformance& a, const SegmentPerformance& b) {
        return a.closed > b.closed;
    });
    return out;
}

std::string describe(const core::Trade& trade) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "%s %s %+.2f%%",
                  trade.instrument.c_str(), trade.horizon_label.c_str(), trade.return_pct);
    return buf;
}
}

bool PerformanceStore::isRealized(const core::Trade& trade) {
    return isTerminal(trade.status) && trade.status != TradeStatus::CANCELLED;
}

void PerformanceStore::rebuild(const std::vector<core::Trade>& trades, const std::vector<core::Trade>& shadows) {
    overall_ = SegmentPerformance{};
    overall_.key = "all";
    open_ = 0;
    by_horizon_.clear();
    by_pattern_.clear();
    by_instrument_.clear();
    shadow_ = ShadowComparison{};

    std::map<std::string, SegmentPerformance> real_by_label;
    for (const auto& trade : trades) {
        if (trade.status == TradeStatus::OPEN) {
            open_++;
            continue;
        }
        if (!isRealized(trade)) {
            continue;
        }
        accumulate(overall_, trade);

        auto& hz = by_horizon_[trade.horizon_days];
        hz.key = trade.horizon_label;
        accumulate(hz, trade);

        const std::string pattern_key = joinPatterns(trade.patterns);
        auto& pat = by_pattern_[pattern_key];
        pat.key = pattern_key;
        accumulate(pat, trade);

        auto& inst = by_instrument_[trade.instrument];
        inst.key = trade.instrument;
        accumulate(inst, trade);

        accumulate(real_by_label[trade.horizon_label], trade);
    }

    shadow_.real = overall_;
    shadow_.shadow.key = "shadow";
    std::map<std::string, SegmentPerformance> shadow_by_label;
    for (const auto& s : shadows) {
        if (s.status == TradeStatus::OPEN) {
            shadow_.shadow_open++;
            continue;
        }
        if (!isRealized(s)) {
            continue;
        }
        accumulate(shadow_.shadow, s);
        accumulate(shadow_by_label[s.horizon_label], s);
    }
    shadow_.filter_alpha = shadow_.real.winRate() - shadow_.shadow.winRate();

    for (const auto& entry : shadow_by_label) {
        HorizonShadowStats hs;
        hs.closed = entry.second.closed;
        hs.wins = entry.second.wins;
        hs.win_rate = entry.second.winRate();
        const auto real = real_by_label.find(entry.first);
        if (real != real_by_label.end()) {
            hs.real_win_rate = real->second.winRate();
            hs.filter_alpha = *hs.real_win_rate - hs.win_rate;
        }
        shadow_.per_horizon[entry.first] = hs;
    }
}

std::vector<SegmentPerformance> PerformanceStore::byHorizon() const {
    std::vector<SegmentPerformance> out;
    for (const auto& entry : by_horizon_) {
        out.push_back(entry.second);
    }
    return out;
}

std::vector<SegmentPerformance> PerformanceStore::byPattern() const {
    return sortedByCount(by_pattern_);
}

std::vector<SegmentPerformance> PerformanceStore::byInstrument() const {
    return sortedByCount(by_instrument_);
}

DailySummary PerformanceStore::dailySummary(const std::vector<core::Trade>& trades, const std::string& date) {
    DailySummary d;
    d.date = date;

    SegmentPerformance today;
    const core::Trade* best = nullptr;
    const core::Trade* worst = nullptr;
    for (const auto& trade : trades) {
        if (trade.signal_date == date) {
            d.trades_opened++;
        }
        if (!isRealized(trade) || trade.exit_date != date) {
            continue;
        }
        accumulate(today, trade);
        if (trade.status == TradeStatus::CLOSED_EXPIRY) {
            if (trade.return_pct > 0.0) {
                d.expired_wins++;
            } else {
                d.expired_losses++;
            }
        }
        if (!best || trade.return_pct > best->return_pct) {
            best = &trade;
        }
        if (!worst || trade.return_pct < worst->return_pct) {
            worst = &trade;
        }
    }

    d.trades_closed = today.closed;
    d.wins = today.wins;
    d.losses = today.losses;
    d.total_return_pct = today.total_return_pct;
    d.avg_win_pct = today.avgWin();
    d.avg_loss_pct = today.avgLoss();
    d.win_rate = today.winRate();
    if (best) {
        d.best_trade = describe(*best);
    }
    if (worst) {
        d.worst_trade = describe(*worst);
    }
    return d;
}

} // namespace engine
} // namespace patternedge
