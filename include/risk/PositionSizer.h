#pragma once

#include <string>

#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace patternedge {
namespace risk {

struct SizingInput {
    double win_rate_pct = 0.0;
    double profit_factor = 0.0;
    double stop_loss_pct = 0.0;
    ConfidenceLevel confidence = ConfidenceLevel::LOW;
    int horizon_days = 5;
    std::string sector;
    double regime_scale = 1.0;
    double capital = 0.0;
};

struct SizingResult {
    double kelly_raw_pct = 0.0;        // full Kelly, before fraction and clamps
    double kelly_fraction_pct = 0.0;   // fractional Kelly clamped to [0, max]
    double confidence_multiplier = 1.0;
    double horizon_multiplier = 1.0;
    double sector_multiplier = 1.0;
    double regime_scale = 1.0;
    double position_pct = 0.0;         // 0 means no trade
    double position_value = 0.0;
    double risk_per_trade = 0.0;       // position_value * stop_loss_pct
    double risk_pct_capital = 0.0;
    double avg_win_est = 0.0;
    double avg_loss_est = 0.0;
    std::string reason;                // set when position_pct is 0
};

// Fractional Kelly sizing. Deterministic and side-effect free.
class PositionSizer {
public:
    explicit PositionSizer(engine::SizingConfig config);

    SizingResult size(const SizingInput& input) const;

    double confidenceMultiplier(ConfidenceLevel level) const;
    double horizonMultiplier(int horizon_days) const;
    double sectorMultiplier(const std::string& sector) const;

private:
    engine::SizingConfig config_;
};

} // namespace risk
} // namespace patternedge
