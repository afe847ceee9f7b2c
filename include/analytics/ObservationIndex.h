#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "analytics/Observation.h"

namespace patternedge {
namespace analytics {

enum class IndexField {
    PATTERN,
    TIMEFRAME,
    TREND,
    VOLATILITY_ZONE,
    PRICE_POSITION,
    SECTOR,
    MARKET_REGIME,
    BROAD_REGIME,   // first '|' component of the regime tag
    INSTRUMENT
};

using IdList = std::vector<std::uint32_t>;

struct BaseRates {
    int count = 0;
    double bullish_pct = 0.0;
    double bearish_pct = 0.0;
    double neutral_pct = 0.0;
};

// Sorted id lists per indexed value. Read-only after construction, safe to share across threads.
class ObservationIndex {
public:
    ObservationIndex(std::vector<Observation> observations, int primary_horizon);

    const IdList& lookup(IndexField field, const std::string& value) const;
    static IdList intersect(const IdList& a, const IdList& b);

    const Observation& at(std::uint32_t id) const { return observations_[id]; }
    std::size_t size() const { return observations_.size(); }
    const std::vector<Observation>& observations() const { return observations_; }

    int primaryHorizon() const { return primary_horizon_; }
    const BaseRates& baseRates() const { return base_rates_; }
    std::size_t distinctValues(IndexField field) const;

private:
    void add(IndexField field, const std::string& value, std::uint32_t id);

    std::vector<Observation> observations_;
    std::map<IndexField, std::map<std::string, IdList>> indices_;
    int primary_horizon_ = 5;
    BaseRates base_rates_;
};

} // namespace analytics
} // namespace patternedge
