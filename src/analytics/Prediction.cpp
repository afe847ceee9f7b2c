#include "analytics/Prediction.h"

#include <algorithm>
#include <cmath>

namespace patternedge {
namespace analytics {

double Prediction::edgeStrength() const {
    return std::max(std::abs(bullish_edge), std::abs(bearish_edge));
}

const HorizonStats* Prediction::horizon(int days) const {
    for (const auto& h : horizons) {
        if (h.horizon == days) {
            return &h;
        }
    }
    return nullptr;
}

} // namespace analytics
} // namespace patternedge
