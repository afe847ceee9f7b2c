#include "analytics/TieredPredictor.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <thread>

namespace patternedge {
namespace analytics {

namespace {
struct Constraint {
    IndexField field;
    std::string value;
    const char* name;
};

IdList evenSubsample(const IdList& ids, std::size_t limit) {
    if (ids.size() <= limit) {
        return ids;
    }
    IdList out;
    out.reserve(limit);
    const double step = static_cast<double>(ids.size()) / static_cast<double>(limit);
    for (std::size_t i = 0; i < limit; ++i) {
        out.push_back(ids[static_cast<std::size_t>(static_cast<double>(i) * step)]);
    }
    return out;
}

double median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    const std::size_t n = values.size();
    return (n % 2 == 1) ? values[n / 2] : (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}
} // namespace

TieredPredictor::TieredPredictor(
    std::shared_ptr<const ObservationIndex> index,
    engine::PredictorConfig config,
    engine::FeedbackConfig feedback_config
)
    : index_(std::move(index))
    , config_(config)
    , blender_(std::move(feedback_config), config) {}

bool TieredPredictor::isTradeablePattern(const std::string& pattern) const {
    if (contains(config_.excluded_patterns, pattern)) {
        return false;
    }
    return config_.allowed_patterns.empty() || contains(config_.allowed_patterns, pattern);
}

bool TieredPredictor::isAcceptedTier(Tier tier) const {
    return std::find(config_.accepted_tiers.begin(), config_.accepted_tiers.end(), tier) !=
           config_.accepted_tiers.end();
}

IdList TieredPredictor::capPerInstrument(const IdList& ids, const std::string& query_instrument) const {
    std::map<std::string, IdList> buckets;
    for (auto id : ids) {
        buckets[index_->at(id).instrument].push_back(id);
    }

    IdList capped;
    const auto max_per = static_cast<std::size_t>(config_.max_per_instrument);
    for (const auto& bucket : buckets) {
        std::size_t limit = max_per;
        // The queried instrument gets a smaller share of its own history
        if (!query_instrument.empty() && bucket.first == query_instrument) {
            limit = std::min(max_per, std::max<std::size_t>(3, bucket.second.size() / 5));
        }
        const auto sampled = evenSubsample(bucket.second, limit);
        capped.insert(capped.end(), sampled.begin(), sampled.end());
    }
    std::sort(capped.begin(), capped.end());
    return capped;
}

IdList TieredPredictor::capPerSector(const IdList& ids) const {
    std::map<std::string, IdList> buckets;
    for (auto id : ids) {
        const auto& sector = index_->at(id).sector;
        buckets[sector.empty() ? "unknown" : sector].push_back(id);
    }

    IdList capped;
    for (const auto& bucket : buckets) {
        const auto sampled = evenSubsample(bucket.second, static_cast<std::size_t>(config_.max_per_sector));
        capped.insert(capped.end(), sampled.begin(), sampled.end());
    }
    std::sort(capped.begin(), capped.end());
    return capped;
}

std::optional<Retrieval> TieredPredictor::retrieve(const std::string& pattern, const QueryContext& ctx) const {
    const IdList& pattern_ids = index_->lookup(IndexField::PATTERN, pattern);
    if (pattern_ids.empty()) {
        return std::nullopt;
    }

    const std::vector<Constraint> all{
        {IndexField::TIMEFRAME, ctx.timeframe, "timeframe"},
        {IndexField::TREND, ctx.trend, "trend"},
        {IndexField::VOLATILITY_ZONE, ctx.volatility_zone, "volatility_zone"},
        {IndexField::PRICE_POSITION, ctx.price_position, "price_position"}};

    // Number of leading constraints applied per tier
    const std::pair<Tier, std::size_t> tiers[] = {
        {Tier::TIER_1, 4}, {Tier::TIER_2, 2}, {Tier::TIER_3, 1}, {Tier::TIER_4, 0}};

    const auto min_matches = static_cast<std::size_t>(config_.min_matches);
    for (const auto& tier : tiers) {
        IdList ids = pattern_ids;
        for (std::size_t i = 0; i < tier.second && !ids.empty(); ++i) {
            if (all[i].value.empty()) {
                continue;
            }
            ids = ObservationIndex::intersect(ids, index_->lookup(all[i].field, all[i].value));
        }
        if (ids.size() < min_matches) {
            continue;
        }

        IdList capped = capPerSector(capPerInstrument(ids, ctx.instrument));
        if (capped.size() < min_matches) {
            continue;
        }

        std::sort(capped.begin(), capped.end(), [this](std::uint32_t a, std::uint32_t b) {
            const auto& ta = index_->at(a).timestamp;
            const auto& tb = index_->at(b).timestamp;
            return ta != tb ? ta > tb : a > b;
        });
        if (capped.size() > static_cast<std::size_t>(config_.top_k)) {
            capped.resize(static_cast<std::size_t>(config_.top_k));
        }

        Retrieval result;
        result.candidates = std::move(capped);
        result.tier = tier.first;
        for (std::size_t i = tier.second; i < all.size(); ++i) {
            if (!all[i].value.empty()) {
                result.dropped_fields.push_back(all[i].name);
            }
        }
        return result;
    }
    return std::nullopt;
}

std::vector<HorizonStats> TieredPredictor::horizonStats(const IdList& ids) const {
    const auto& base = index_->baseRates();
    std::vector<HorizonStats> out;

    for (int h : config_.horizons) {
        std::vector<double> returns;
        int bullish = 0;
        int bearish = 0;
        for (auto id : ids) {
            const auto* outcome = index_->at(id).outcome(h);
            if (!outcome) {
                continue;
            }
            returns.push_back(outcome->return_pct);
            if (outcome->direction == Direction::BULLISH) ++bullish;
            if (outcome->direction == Direction::BEARISH) ++bearish;
        }
        if (returns.empty()) {
            continue;
        }

        HorizonStats s;
        s.horizon = h;
        s.count = static_cast<int>(returns.size());
        s.bullish_pct = bullish * 100.0 / s.count;
        s.bearish_pct = bearish * 100.0 / s.count;
        s.bullish_edge = s.bullish_pct - base.bullish_pct;
        s.bearish_edge = s.bearish_pct - base.bearish_pct;
        if (std::abs(s.bullish_edge) < config_.edge_threshold_pct &&
            std::abs(s.bearish_edge) < config_.edge_threshold_pct) {
            s.direction = Direction::NEUTRAL;
        } else {
            s.direction = (s.bullish_edge > s.bearish_edge) ? Direction::BULLISH : Direction::BEARISH;
        }

        const double sum = std::accumulate(returns.begin(), returns.end(), 0.0);
        s.avg_return = sum / s.count;
        double sq = 0.0;
        for (double r : returns) {
            sq += (r - s.avg_return) * (r - s.avg_return);
        }
        s.std_return = std::sqrt(sq / s.count);
        s.median_return = median(returns);
        s.min_return = *std::min_element(returns.begin(), returns.end());
        s.max_return = *std::max_element(returns.begin(), returns.end());
        out.push_back(s);
    }
    return out;
}

double TieredPredictor::stopLossPct(const std::string& pattern, double atr, double close) const {
    const double mult = contains(config_.structural_patterns, pattern)
        ? config_.structural_sl_multiplier
        : config_.standard_sl_multiplier;
    const double sl = (atr > 0.0 && close > 0.0) ? mult * atr / close * 100.0 : 1.0;
    return std::clamp(sl, config_.sl_floor_pct, config_.sl_cap_pct);
}

double TieredPredictor::confidenceScore(double edge_strength_pct, int n_matches, Tier tier,
                                        double profit_factor) const {
    const double edge = edge_strength_pct / 100.0;
    const double sample = std::min(1.0, n_matches / config_.sample_saturation);
    const double tier_quality = config_.tier_quality[static_cast<int>(tier) - 1];
    const double pf_factor = std::clamp((profit_factor - 0.5) / 1.5, 0.0, 1.0);
    const double score = edge * config_.weight_edge +
                         sample * config_.weight_sample +
                         tier_quality * config_.weight_tier +
                         pf_factor * config_.weight_profit_factor;
    return std::clamp(score, 0.0, 1.0);
}

ConfidenceLevel TieredPredictor::confidenceLevel(double score) const {
    if (score > config_.high_confidence_threshold) {
        return ConfidenceLevel::HIGH;
    }
    if (score > config_.medium_confidence_threshold) {
        return ConfidenceLevel::MEDIUM;
    }
    return ConfidenceLevel::LOW;
}

std::optional<Prediction> TieredPredictor::predict(
    const std::string& pattern,
    const QueryContext& ctx,
    const engine::FeedbackSnapshot* feedback
) const {
    if (!isTradeablePattern(pattern)) {
        return std::nullopt;
    }

    const auto retrieval = retrieve(pattern, ctx);
    if (!retrieval) {
        LOG_DEBUG("{} {}: fewer than {} matches at every tier", ctx.instrument, pattern, config_.min_matches);
        return std::nullopt;
    }
    if (!isAcceptedTier(retrieval->tier)) {
        LOG_DEBUG("{} {}: {} not accepted ({} matches)", ctx.instrument, pattern,
                  toString(retrieval->tier), retrieval->candidates.size());
        return std::nullopt;
    }
    const IdList& ids = retrieval->candidates;

    Prediction p;
    p.pattern = pattern;
    p.tier = retrieval->tier;
    p.dropped_fields = retrieval->dropped_fields;
    p.n_matches = static_cast<int>(ids.size());
    p.primary_horizon = config_.primary_horizon;
    p.horizons = horizonStats(ids);

    const HorizonStats* primary = p.horizon(config_.primary_horizon);
    if (!primary) {
        return std::nullopt;
    }
    p.direction = primary->direction;
    p.bullish_edge = primary->bullish_edge;
    p.bearish_edge = primary->bearish_edge;
    p.avg_return = primary->avg_return;
    p.median_return = primary->median_return;

    std::set<std::string> instruments;
    std::vector<double> trades;
    std::vector<double> trades_sl;
    int sl_triggered = 0;
    double mfe_sum = 0.0;
    double mae_sum = 0.0;
    int excursion_count = 0;
    double sl_sum = 0.0;

    for (auto id : ids) {
        const auto& obs = index_->at(id);
        instruments.insert(obs.instrument);
        const auto* outcome = obs.outcome(config_.primary_horizon);
        if (!outcome) {
            continue;
        }
        mfe_sum += outcome->mfe_pct;
        mae_sum += outcome->mae_pct;
        ++excursion_count;

        const double sl = stopLossPct(pattern, obs.atr, obs.close);
        sl_sum += sl;
        if (p.direction == Direction::BULLISH) {
            trades.push_back(outcome->return_pct);
            const bool stopped = outcome->mae_pct < -sl;
            trades_sl.push_back(stopped ? -sl : outcome->return_pct);
            if (stopped) ++sl_triggered;
        } else if (p.direction == Direction::BEARISH) {
            trades.push_back(-outcome->return_pct);
            const bool stopped = outcome->mfe_pct > sl;
            trades_sl.push_back(stopped ? -sl : -outcome->return_pct);
            if (stopped) ++sl_triggered;
        }
    }
    p.instrument_diversity = static_cast<int>(instruments.size());

    auto summarize = [this](const std::vector<double>& rets, double& win_rate, double& pf) {
        if (rets.empty()) {
            win_rate = 0.0;
            pf = 0.0;
            return;
        }
        int wins = 0;
        int losses = 0;
        double gross_win = 0.0;
        double gross_loss = 0.0;
        for (double r : rets) {
            if (r > 0.0) {
                ++wins;
                gross_win += r;
            } else {
                ++losses;
                gross_loss += r;
            }
        }
        win_rate = wins * 100.0 / static_cast<double>(rets.size());
        gross_loss = (losses > 0) ? std::abs(gross_loss) : config_.gross_loss_floor;
        pf = (gross_loss > 0.0) ? gross_win / gross_loss : 0.0;
    };
    summarize(trades, p.win_rate, p.profit_factor);
    summarize(trades_sl, p.sl_win_rate, p.sl_profit_factor);
    p.sl_trigger_pct = trades_sl.empty() ? 0.0 : sl_triggered * 100.0 / trades_sl.size();
    p.sl_pct = excursion_count > 0 ? sl_sum / excursion_count : config_.sl_floor_pct;

    if (excursion_count > 0) {
        p.avg_mfe = mfe_sum / excursion_count;
        p.avg_mae = mae_sum / excursion_count;
    }
    p.rr_ratio = (p.avg_mae != 0.0) ? std::abs(p.avg_mfe / p.avg_mae) : 0.0;

    p.confidence = confidenceScore(p.edgeStrength(), p.n_matches, p.tier, p.profit_factor);
    p.confidence_level = confidenceLevel(p.confidence);
    p.raw_win_rate = p.win_rate;
    p.raw_confidence = p.confidence;

    if (feedback) {
        engine::BlendQuery query;
        query.pattern = pattern;
        query.trend = ctx.trend;
        query.horizon_label = horizonLabel(config_.primary_horizon);
        query.sector = ctx.sector;
        return blender_.blend(p, *feedback, query);
    }
    return p;
}

std::optional<Prediction> TieredPredictor::predictBest(
    const std::vector<std::string>& patterns,
    const QueryContext& ctx,
    const engine::FeedbackSnapshot* feedback
) const {
    std::optional<Prediction> best;
    for (const auto& pattern : patterns) {
        auto prediction = predict(pattern, ctx, feedback);
        if (!prediction) {
            continue;
        }
        if (!best || prediction->edgeStrength() > best->edgeStrength()) {
            best = std::move(prediction);
        }
    }
    return best;
}

std::vector<std::optional<Prediction>> TieredPredictor::predictBatch(
    const std::vector<PredictionQuery>& queries,
    const engine::FeedbackSnapshot* feedback,
    int workers
) const {
    std::vector<std::optional<Prediction>> results(queries.size());
    const std::size_t worker_count = std::max<std::size_t>(
        1, std::min<std::size_t>(static_cast<std::size_t>(std::max(workers, 1)), queries.size()));

    auto run = [&](std::size_t begin) {
        for (std::size_t i = begin; i < queries.size(); i += worker_count) {
            results[i] = predictBest(queries[i].patterns, queries[i].context, feedback);
        }
    };

    if (worker_count <= 1) {
        run(0);
        return results;
    }

    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (std::size_t w = 0; w < worker_count; ++w) {
        threads.emplace_back(run, w);
    }
    for (auto& t : threads) {
        t.join();
    }
    return results;
}

} // namespace analytics
} // namespace patternedge
