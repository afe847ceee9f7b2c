#include "risk/PositionSizer.h"

#include <algorithm>
#include <cctype>

namespace patternedge {
namespace risk {

PositionSizer::PositionSizer(engine::SizingConfig config)
    : config_(std::move(config)) {}

double PositionSizer::confidenceMultiplier(ConfidenceLevel level) const {
    switch (level) {
        case ConfidenceLevel::HIGH: return config_.high_confidence_multiplier;
        case ConfidenceLevel::MEDIUM: return config_.medium_confidence_multiplier;
        case ConfidenceLevel::LOW: return config_.low_confidence_multiplier;
    }
    return config_.default_multiplier;
}

double PositionSizer::horizonMultiplier(int horizon_days) const {
    const auto it = config_.horizon_multipliers.find(horizon_days);
    return it == config_.horizon_multipliers.end() ? config_.default_multiplier : it->second;
}

double PositionSizer::sectorMultiplier(const std::string& sector) const {
    std::string key = sector;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto it = config_.sector_multipliers.find(key);
    return it == config_.sector_multipliers.end() ? config_.default_multiplier : it->second;
}

SizingResult PositionSizer::size(const SizingInput& in) const {
    SizingResult r;
    r.confidence_multiplier = confidenceMultiplier(in.confidence);
    r.horizon_multiplier = horizonMultiplier(in.horizon_days);
    r.sector_multiplier = sectorMultiplier(in.sector);
    r.regime_scale = std::clamp(in.regime_scale, 0.0, 1.0);

    const double w = in.win_rate_pct / 100.0;
    const double avg_loss = in.stop_loss_pct;
    r.avg_loss_est = avg_loss;

    if (w <= 0.0 || avg_loss <= 0.0 || in.profit_factor <= 0.0) {
        r.reason = "no_edge";
        return r;
    }

    // profit_factor = (w * avg_win) / ((1 - w) * avg_loss)
    double kelly = 0.0;
    if (w >= 1.0) {
        kelly = 1.0;
        r.avg_win_est = in.profit_factor * avg_loss;
    } else {
        const double avg_win = in.profit_factor * (1.0 - w) * avg_loss / w;
        r.avg_win_est = avg_win;
        const double payoff = avg_win / avg_loss;
        kelly = w - (1.0 - w) / payoff;
    }
    r.kelly_raw_pct = kelly * 100.0;

    const double max_frac = config_.max_position_pct / 100.0;
    const double fractional = std::clamp(kelly * config_.kelly_fraction, 0.0, max_frac);
    r.kelly_fraction_pct = fractional * 100.0;

    double pct = r.kelly_fraction_pct * r.confidence_multiplier * r.horizon_multiplier *
                 r.sector_multiplier * r.regime_scale;
    if (pct < config_.min_position_pct || pct <= 0.0) {
        r.reason = (kelly <= 0.0) ? "negative_kelly"
                 : (r.regime_scale <= 0.0) ? "regime_blocked"
                 : "below_min_position";
        return r;
    }
    pct = std::min(pct, config_.max_position_pct);

    r.position_pct = pct;
    r.position_value = in.capital * pct / 100.0;
    r.risk_per_trade = r.position_value * in.stop_loss_pct / 100.0;
    r.risk_pct_capital = in.capital > 0.0 ? r.risk_per_trade / in.capital * 100.0 : 0.0;
    return r;
}

} // namespace risk
} // namespace patternedge
