#include "engine/FeedbackBlender.h"

#include <algorithm>

namespace patternedge {
namespace engine {
namespace {
const std::string kVolumePatternPrefix = "volume_per_pattern_";

double paperWinRate(const AdjustmentRecord& record) {
    return record.total_trades > 0 ? record.decay_weighted_win_rate : record.win_rate;
}

bool isAligned(Direction direction, const std::string& trend) {
    return (direction == Direction::BULLISH && trend == "bullish") ||
           (direction == Direction::BEARISH && trend == "bearish");
}
}

FeedbackBlender::FeedbackBlender(FeedbackConfig config, PredictorConfig predictor_config)
    : config_(std::move(config))
    , predictor_config_(std::move(predictor_config)) {}

double FeedbackBlender::blendWeight(int trades) const {
    if (trades <= 0) {
        return 0.0;
    }
    const double n = static_cast<double>(trades);
    return std::min(config_.max_blend_weight, n / (n + config_.blend_prior_trades));
}

std::optional<BlendSource> FeedbackBlender::selectSource(
    const FeedbackSnapshot& snapshot,
    const BlendQuery& query
) const {
    std::vector<std::pair<AdjustmentKey, int>> cascade;
    if (!query.trend.empty() && !query.horizon_label.empty()) {
        cascade.emplace_back(AdjustmentKey::forTriple(query.pattern, query.trend, query.horizon_label),
                             config_.min_triple_trades);
    }
    if (!query.horizon_label.empty()) {
        cascade.emplace_back(AdjustmentKey::forHorizon(query.pattern, query.horizon_label),
                             config_.min_horizon_trades);
    }
    if (!query.sector.empty()) {
        cascade.emplace_back(AdjustmentKey::forSector(query.pattern, query.sector),
                             config_.min_sector_trades);
    }
    if (!query.trend.empty()) {
        cascade.emplace_back(AdjustmentKey::forTrend(query.pattern, query.trend),
                             config_.min_trend_trades);
    }
    cascade.emplace_back(AdjustmentKey::forPattern(query.pattern), config_.min_pattern_trades);

    for (const auto& step : cascade) {
        const auto* record = snapshot.find(step.first);
        if (record && record->total_trades >= step.second) {
            return BlendSource{step.first, *record};
        }
    }
    return std::nullopt;
}

std::optional<double> FeedbackBlender::horizonWinRate(
    const FeedbackSnapshot& snapshot,
    const std::vector<std::string>& patterns,
    const std::string& trend,
    const std::string& horizon_label
) const {
    if (horizon_label.empty()) {
        return std::nullopt;
    }
    for (const auto& pattern : patterns) {
        if (!trend.empty()) {
            const auto* triple = snapshot.find(AdjustmentKey::forTriple(pattern, trend, horizon_label));
            if (triple && triple->total_trades >= config_.min_triple_trades) {
                return paperWinRate(*triple);
            }
        }
        const auto* horizon = snapshot.find(AdjustmentKey::forHorizon(pattern, horizon_label));
        if (horizon && horizon->total_trades >= config_.min_horizon_trades) {
            return paperWinRate(*horizon);
        }
    }
    return std::nullopt;
}

double FeedbackBlender::ruleConfidenceBoost(
    const FeedbackSnapshot& snapshot,
    const BlendQuery& query,
    Direction direction
) const {
    double boost = 0.0;
    for (const auto& rule : snapshot.rules) {
        const double conf = rule.confidence;
        const double scale = std::min(3.0, 1.0 + conf * 2.5);

        if (rule.context == "trend_alignment") {
            if (query.trend.empty()) {
                continue;
            }
            if (isAligned(direction, query.trend)) {
                boost += config_.trend_aligned_boost * scale * conf;
            } else {
                boost -= config_.counter_trend_penalty * scale * conf;
            }
        } else if (rule.context == "volume_confirmation") {
            boost += config_.volume_confirmation_boost * scale * conf;
        } else if (rule.context.compare(0, kVolumePatternPrefix.size(), kVolumePatternPrefix) == 0) {
            if (rule.context.substr(kVolumePatternPrefix.size()) == query.pattern) {
                boost += config_.volume_pattern_boost * scale * conf;
            }
        } else if (rule.context == "stop_loss_tuning") {
            boost -= config_.stop_loss_penalty * scale * conf;
        }
    }

    const auto vb = snapshot.volume_breakdown.find(query.pattern);
    if (vb != snapshot.volume_breakdown.end() &&
        snapshot.find(AdjustmentKey::forPattern(query.pattern)) != nullptr) {
        const auto confirmed = vb->second.confirmedWinRate();
        const auto unconfirmed = vb->second.unconfirmedWinRate();
        if (confirmed && unconfirmed) {
            const double vol_edge = (*confirmed - *unconfirmed) / 100.0;
            if (vol_edge > config_.volume_edge_threshold) {
                boost += vol_edge * config_.volume_edge_gain;
            }
        }
    }
    return boost;
}

analytics::Prediction FeedbackBlender::blend(
    const analytics::Prediction& raw,
    const FeedbackSnapshot& snapshot,
    const BlendQuery& query
) const {
    analytics::Prediction out = raw;
    out.raw_win_rate = raw.win_rate;
    out.raw_confidence = raw.confidence;
    out.feedback = analytics::FeedbackTrace{};

    if (const auto source = selectSource(snapshot, query)) {
        const double paper = paperWinRate(source->record);
        const double w = blendWeight(source->record.total_trades);
        out.win_rate = raw.win_rate * (1.0 - w) + paper * w;
        out.feedback.applied = true;
        out.feedback.source = source->key.toString();
        out.feedback.weight = w;
        out.feedback.paper_win_rate = paper;
        out.feedback.paper_trades = source->record.total_trades;
    }

    const double boost = ruleConfidenceBoost(snapshot, query, raw.direction);
    if (boost != 0.0) {
        out.confidence = std::clamp(raw.confidence + boost, 0.0, 1.0);
        out.confidence_level =
            out.confidence > predictor_config_.high_confidence_threshold ? ConfidenceLevel::HIGH :
            out.confidence > predictor_config_.medium_confidence_threshold ? ConfidenceLevel::MEDIUM :
            ConfidenceLevel::LOW;
        out.feedback.confidence_boost = boost;
    }
    return out;
}

} // namespace engine
} // namespace patternedge
