#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <optional>
#include <string>
#include <vector>

namespace patternedge {
namespace analytics {

enum class MarketRegime {
    BULL_LOW_VOL,       // index above its long DMA, calm volatility index
    BULL_HIGH_VOL,
    BEAR_LOW_VOL,
    BEAR_HIGH_VOL,
    EXTREME             // volatility index at or above the extreme threshold, no trading
};

std::string toString(MarketRegime regime);

struct RegimeAnalysis {
    MarketRegime regime = MarketRegime::BULL_LOW_VOL;
    double scale = 1.0;
    std::string trend = "unknown";      // bull | bear | unknown
    std::string vol_level = "unknown";  // low_vol | high_vol | extreme | unknown
    std::optional<double> index_close;
    std::optional<double> dma;
    std::optional<double> vix_value;
    std::string as_of;
};

// Market-wide regime from index closes vs their long moving average and a volatility index.
// Missing data defaults to bull / low_vol.
class RegimeDetector {
public:
    RegimeDetector(engine::RegimeConfig config,
                   std::vector<DailyBar> index_bars,
                   std::vector<DailyBar> vix_bars);

    // Uses bars dated on or before as_of; latest data when as_of is empty
    RegimeAnalysis detect(const std::string& as_of = "") const;

    // Scale from the horizon's override table, the default table otherwise
    double horizonScale(const std::string& horizon_label, const std::string& as_of = "") const;
    double scaleFor(MarketRegime regime, const std::string& horizon_label = "") const;

    // One classification per index date in [from, to]
    std::vector<RegimeAnalysis> history(const std::string& from, const std::string& to) const;

    bool hasIndexData() const { return !index_bars_.empty(); }
    bool hasVolatilityData() const { return !vix_bars_.empty(); }

private:
    static std::size_t barsUpTo(const std::vector<DailyBar>& bars, const std::string& as_of);

    engine::RegimeConfig config_;
    std::vector<DailyBar> index_bars_;
    std::vector<DailyBar> vix_bars_;
};

} // namespace analytics
} // namespace patternedge
