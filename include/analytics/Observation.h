#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "common/Types.h"

namespace patternedge {
namespace analytics {

// Realized outcome of one observation over a forward horizon
struct HorizonOutcome {
    double return_pct = 0.0;
    Direction direction = Direction::NEUTRAL;
    double mfe_pct = 0.0;
    double mae_pct = 0.0;
};

// Immutable historical record produced by the feature pipeline
struct Observation {
    std::uint32_t id = 0;
    std::string source_id;
    std::vector<std::string> patterns;
    std::string instrument;
    std::string sector;
    std::string timeframe;
    std::string trend;
    std::string volatility_zone;
    std::string price_position;
    std::string market_regime;
    std::string timestamp;
    double close = 0.0;
    double atr = 0.0;
    double volume_ratio = 1.0;
    std::map<int, HorizonOutcome> outcomes;

    const HorizonOutcome* outcome(int horizon) const {
        const auto it = outcomes.find(horizon);
        return it == outcomes.end() ? nullptr : &it->second;
    }
};

// Live context a prediction is asked for. Empty fields are not constrained.
struct QueryContext {
    std::string timeframe;
    std::string trend;
    std::string volatility_zone;
    std::string price_position;
    std::string market_regime;
    std::string instrument;
    std::string sector;
};

} // namespace analytics
} // namespace patternedge
