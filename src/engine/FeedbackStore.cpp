#include "engine/FeedbackStore.h"
#include "common/DateUtils.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>

namespace patternedge {
namespace engine {

namespace {

struct SegmentStats {
    int wins = 0;
    int total = 0;
    double return_sum = 0.0;
    double weighted_wins = 0.0;
    double weighted_total = 0.0;

    void add(bool won, double ret, double weight) {
        ++total;
        if (won) {
            ++wins;
            weighted_wins += weight;
        }
        return_sum += ret;
        weighted_total += weight;
    }

    double winRate() const {
        return total > 0 ? static_cast<double>(wins) / total * 100.0 : 0.0;
    }

    AdjustmentRecord toRecord() const {
        AdjustmentRecord r;
        r.total_trades = total;
        r.wins = wins;
        r.win_rate = winRate();
        r.decay_weighted_win_rate = weighted_total > 0.0 ? weighted_wins / weighted_total * 100.0 : r.win_rate;
        r.avg_return = total > 0 ? return_sum / total : 0.0;
        return r;
    }
};

bool isTrendAligned(const OutcomeRecord& o) {
    return (o.direction == Direction::BULLISH && o.trend_at_entry == "bullish") ||
           (o.direction == Direction::BEARISH && o.trend_at_entry == "bearish");
}

std::string formatPct(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.0f%%", v);
    return buf;
}

std::string today() {
    return utils::DateUtils::dateFromMs(getCurrentTimestampMs());
}

} // namespace

FeedbackStore::FeedbackStore(FeedbackConfig config, std::shared_ptr<core::IFeedbackStateStore> store)
    : config_(std::move(config))
    , store_(std::move(store))
    , current_(std::make_shared<const FeedbackSnapshot>())
{}

void FeedbackStore::load() {
    if (!store_) {
        return;
    }
    auto loaded = store_->load();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded) {
        LOG_WARN("No feedback document found, predictions will use raw statistics");
        persisted_version_ = 0;
        current_ = std::make_shared<const FeedbackSnapshot>();
        return;
    }
    persisted_version_ = loaded->version;
    LOG_INFO("Feedback loaded (v{}): {} outcomes, {} segments, {} rules",
             loaded->version, loaded->outcomes.size(), loaded->adjustments.size(), loaded->rules.size());
    current_ = std::make_shared<const FeedbackSnapshot>(std::move(*loaded));
}

std::shared_ptr<const FeedbackSnapshot> FeedbackStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::shared_ptr<const FeedbackSnapshot> FeedbackStore::usableSnapshot(const std::string& as_of) const {
    auto snap = snapshot();
    if (snap->empty()) {
        LOG_WARN("Feedback is empty, using raw predictions");
        return nullptr;
    }
    if (isStale(as_of)) {
        LOG_WARN("Feedback last rebuilt {} is older than {} days, using raw predictions",
                 snap->updated_at, config_.max_age_days);
        return nullptr;
    }
    return snap;
}

bool FeedbackStore::isStale(const std::string& as_of) const {
    if (config_.max_age_days <= 0) {
        return false;
    }
    auto snap = snapshot();
    if (snap->updated_at.empty()) {
        return true;
    }
    const std::string ref = as_of.empty() ? today() : as_of;
    if (!utils::DateUtils::isValidDate(snap->updated_at) || !utils::DateUtils::isValidDate(ref)) {
        return true;
    }
    return utils::DateUtils::daysBetween(snap->updated_at, ref) > config_.max_age_days;
}

std::uint64_t FeedbackStore::persistedVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return persisted_version_;
}

int FeedbackStore::ingest(const std::vector<OutcomeRecord>& outcomes, const std::string& as_of) {
    for (const auto& o : outcomes) {
        o.validate();
    }

    const std::string ref = as_of.empty() ? today() : as_of;
    // Build off the lock, retry when another writer published in between
    for (;;) {
        auto base = snapshot();
        std::set<std::string> seen;
        for (const auto& o : base->outcomes) {
            seen.insert(o.trade_id);
        }

        std::vector<OutcomeRecord> merged = base->outcomes;
        int added = 0;
        for (const auto& o : outcomes) {
            if (!seen.insert(o.trade_id).second) {
                LOG_INFO("Outcome {} already ingested, skipping", o.trade_id);
                continue;
            }
            merged.push_back(o);
            ++added;
        }

        FeedbackSnapshot next = build(merged, ref, config_);
        next.version = base->version;
        if (!publishIfCurrent(base, std::move(next))) {
            continue;
        }

        if (added > 0) {
            LOG_INFO("Ingested {} new outcomes ({} total)", added, merged.size());
        }
        return added;
    }
}

void FeedbackStore::rebuild(const std::string& as_of) {
    const std::string ref = as_of.empty() ? today() : as_of;
    for (;;) {
        auto base = snapshot();
        FeedbackSnapshot next = build(base->outcomes, ref, config_);
        next.version = base->version;
        if (publishIfCurrent(base, std::move(next))) {
            return;
        }
    }
}

bool FeedbackStore::publishIfCurrent(const std::shared_ptr<const FeedbackSnapshot>& base, FeedbackSnapshot next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ != base) {
        return false;
    }
    current_ = std::make_shared<const FeedbackSnapshot>(std::move(next));
    return true;
}

bool FeedbackStore::save() {
    if (!store_) {
        return true;
    }

    std::uint64_t expected = 0;
    std::shared_ptr<const FeedbackSnapshot> base;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        expected = persisted_version_;
        base = current_;
    }

    FeedbackSnapshot next = *base;
    next.version = expected + 1;
    if (!store_->save(next, expected)) {
        LOG_ERROR("Failed to save feedback document v{}", next.version);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    persisted_version_ = next.version;
    // Keep whatever was published meanwhile, only stamp the version when it is still ours
    if (current_ == base) {
        current_ = std::make_shared<const FeedbackSnapshot>(std::move(next));
    }
    return true;
}

double FeedbackStore::decayWeight(const std::string& exit_date, const std::string& as_of,
                                  const FeedbackConfig& config) {
    const std::string day = utils::DateUtils::datePart(exit_date);
    if (!utils::DateUtils::isValidDate(day) || !utils::DateUtils::isValidDate(as_of)) {
        return config.unknown_age_weight;
    }
    const double age = static_cast<double>(
        (std::max)(0LL, utils::DateUtils::daysBetween(day, as_of)));
    return std::pow(2.0, -age / config.decay_half_life_days);
}

FeedbackSnapshot FeedbackStore::build(const std::vector<OutcomeRecord>& outcomes,
                                      const std::string& as_of,
                                      const FeedbackConfig& config) {
    FeedbackSnapshot snap;
    snap.outcomes = outcomes;
    snap.updated_at = as_of;

    if (static_cast<int>(outcomes.size()) < config.min_outcomes_for_rebuild) {
        return snap;
    }

    std::map<AdjustmentKey, SegmentStats> segments;
    std::map<std::string, VolumeBreakdown> volume;

    for (const auto& o : outcomes) {
        const double w = decayWeight(o.exit_date, as_of, config);
        const bool vol_confirmed = o.volume_ratio > config.volume_confirm_ratio;

        for (const auto& p : o.patterns) {
            segments[AdjustmentKey::forPattern(p)].add(o.won, o.actual_return_pct, w);
            segments[AdjustmentKey::forTrend(p, o.trend_at_entry)].add(o.won, o.actual_return_pct, w);
            segments[AdjustmentKey::forHorizon(p, o.horizon_label)].add(o.won, o.actual_return_pct, w);
            segments[AdjustmentKey::forTriple(p, o.trend_at_entry, o.horizon_label)]
                .add(o.won, o.actual_return_pct, w);
            if (o.sector != "unknown") {
                segments[AdjustmentKey::forSector(p, o.sector)].add(o.won, o.actual_return_pct, w);
            }

            auto& vb = volume[p];
            if (vol_confirmed) {
                vb.confirmed_trades++;
                if (o.won) vb.confirmed_wins++;
            } else {
                vb.unconfirmed_trades++;
                if (o.won) vb.unconfirmed_wins++;
            }
        }
    }

    for (const auto& [key, stats] : segments) {
        if (stats.total < config.min_segment_trades) {
            continue;
        }
        snap.adjustments[key] = stats.toRecord();
        if (key.kind == AdjustmentKind::PATTERN) {
            snap.volume_breakdown[key.pattern] = volume[key.pattern];
        }
    }

    // Account-wide rules
    int aligned_total = 0, aligned_wins = 0, counter_total = 0, counter_wins = 0;
    int vol_total = 0, vol_wins = 0, sl_exits = 0;
    for (const auto& o : outcomes) {
        if (isTrendAligned(o)) {
            ++aligned_total;
            if (o.won) ++aligned_wins;
        } else {
            ++counter_total;
            if (o.won) ++counter_wins;
        }
        if (o.volume_ratio > config.volume_confirm_ratio) {
            ++vol_total;
            if (o.won) ++vol_wins;
        }
        if (o.stop_loss_triggered) {
            ++sl_exits;
        }
    }

    if (aligned_total >= 3 && counter_total >= 3) {
        const double aligned_wr = static_cast<double>(aligned_wins) / aligned_total * 100.0;
        const double counter_wr = static_cast<double>(counter_wins) / counter_total * 100.0;
        if (aligned_wr > counter_wr + 10.0) {
            snap.rules.push_back(FeedbackRule{
                "trend_alignment", (std::min)(0.9, aligned_total / 20.0), "prefer",
                "Trend-aligned trades win " + formatPct(aligned_wr) + " vs counter-trend " + formatPct(counter_wr)});
        }
    }
    if (vol_total >= 3) {
        const double vol_wr = static_cast<double>(vol_wins) / vol_total * 100.0;
        if (vol_wr > 60.0) {
            snap.rules.push_back(FeedbackRule{
                "volume_confirmation", (std::min)(0.85, vol_total / 15.0), "prefer",
                "Volume-confirmed trades win " + formatPct(vol_wr)});
        }
    }
    if (sl_exits >= 3) {
        const double sl_rate = static_cast<double>(sl_exits) / outcomes.size() * 100.0;
        if (sl_rate > 40.0) {
            snap.rules.push_back(FeedbackRule{
                "stop_loss_tuning", (std::min)(0.8, sl_exits / 10.0), "adjust",
                "Stop-loss hit rate is " + formatPct(sl_rate)});
        }
    }
    for (const auto& [pattern, vb] : volume) {
        if (vb.confirmed_trades < 3 || vb.unconfirmed_trades < 3) {
            continue;
        }
        const double vc = static_cast<double>(vb.confirmed_wins) / vb.confirmed_trades * 100.0;
        const double vn = static_cast<double>(vb.unconfirmed_wins) / vb.unconfirmed_trades * 100.0;
        if (vc > vn + 15.0) {
            snap.rules.push_back(FeedbackRule{
                "volume_per_pattern_" + pattern, (std::min)(0.85, vb.confirmed_trades / 10.0), "prefer",
                pattern + " with volume " + formatPct(vc) + " vs without " + formatPct(vn)});
        }
    }

    // Filter penalties / boosts
    for (const auto& [key, stats] : segments) {
        const double wr = stats.winRate();
        int reject_min = 0, relax_min = 0;
        double reject_below = 0.0, relax_above = 0.0;
        std::string label;
        switch (key.kind) {
            case AdjustmentKind::PATTERN:
                reject_min = config.pattern_reject_min_trades;
                reject_below = config.pattern_reject_below_pct;
                relax_min = config.pattern_relax_min_trades;
                relax_above = config.pattern_relax_above_pct;
                label = "Pattern";
                break;
            case AdjustmentKind::PATTERN_HORIZON:
                label = "Horizon";
                break;
            case AdjustmentKind::PATTERN_SECTOR:
                label = "Sector";
                break;
            default:
                continue;
        }
        if (key.kind != AdjustmentKind::PATTERN) {
            reject_min = config.segment_reject_min_trades;
            reject_below = config.segment_reject_below_pct;
            relax_min = config.segment_relax_min_trades;
            relax_above = config.segment_relax_above_pct;
        }
        if (stats.total < reject_min) {
            continue;
        }

        const std::string summary = label + " WR " + formatPct(wr) + " on " + std::to_string(stats.total) + " trades";
        if (wr < reject_below) {
            snap.filters[key] = FilterAdjustment{FilterAction::REJECT, wr, stats.total, summary};
        } else if (wr > relax_above && stats.total >= relax_min) {
            snap.filters[key] = FilterAdjustment{FilterAction::RELAX, wr, stats.total, summary + " (strong)"};
        }
    }

    return snap;
}

} // namespace engine
} // namespace patternedge
