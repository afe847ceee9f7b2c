#include "analytics/ObservationIndex.h"

#include <algorithm>
#include <iterator>

namespace patternedge {
namespace analytics {

namespace {
const IdList kEmpty;

std::string broadRegime(const std::string& regime) {
    const auto pos = regime.find('|');
    return pos == std::string::npos ? regime : regime.substr(0, pos);
}
}

ObservationIndex::ObservationIndex(std::vector<Observation> observations, int primary_horizon)
    : observations_(std::move(observations))
    , primary_horizon_(primary_horizon) {
    int bullish = 0;
    int bearish = 0;
    int neutral = 0;

    for (std::uint32_t id = 0; id < observations_.size(); ++id) {
        auto& obs = observations_[id];
        obs.id = id;

        for (const auto& pattern : obs.patterns) {
            add(IndexField::PATTERN, pattern, id);
        }
        add(IndexField::TIMEFRAME, obs.timeframe, id);
        add(IndexField::TREND, obs.trend, id);
        add(IndexField::VOLATILITY_ZONE, obs.volatility_zone, id);
        add(IndexField::PRICE_POSITION, obs.price_position, id);
        add(IndexField::SECTOR, obs.sector, id);
        add(IndexField::MARKET_REGIME, obs.market_regime, id);
        add(IndexField::BROAD_REGIME, broadRegime(obs.market_regime), id);
        add(IndexField::INSTRUMENT, obs.instrument, id);

        if (const auto* outcome = obs.outcome(primary_horizon_)) {
            switch (outcome->direction) {
                case Direction::BULLISH: ++bullish; break;
                case Direction::BEARISH: ++bearish; break;
                case Direction::NEUTRAL: ++neutral; break;
            }
        }
    }

    // A pattern listed twice on one observation must not duplicate its id
    for (auto& by_value : indices_[IndexField::PATTERN]) {
        auto& ids = by_value.second;
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    }

    base_rates_.count = bullish + bearish + neutral;
    if (base_rates_.count > 0) {
        const double n = static_cast<double>(base_rates_.count);
        base_rates_.bullish_pct = bullish / n * 100.0;
        base_rates_.bearish_pct = bearish / n * 100.0;
        base_rates_.neutral_pct = neutral / n * 100.0;
    }
}

void ObservationIndex::add(IndexField field, const std::string& value, std::uint32_t id) {
    if (value.empty()) {
        return;
    }
    // ids are appended in ascending order, lists stay sorted
    indices_[field][value].push_back(id);
}

const IdList& ObservationIndex::lookup(IndexField field, const std::string& value) const {
    const auto field_it = indices_.find(field);
    if (field_it == indices_.end()) {
        return kEmpty;
    }
    const auto it = field_it->second.find(value);
    return it == field_it->second.end() ? kEmpty : it->second;
}

IdList ObservationIndex::intersect(const IdList& a, const IdList& b) {
    IdList out;
    out.reserve(std::min(a.size(), b.size()));
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

std::size_t ObservationIndex::distinctValues(IndexField field) const {
    const auto it = indices_.find(field);
    return it == indices_.end() ? 0 : it->second.size();
}

} // namespace analytics
} // namespace patternedge
