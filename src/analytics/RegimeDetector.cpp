#include "analytics/RegimeDetector.h"
#include "common/Logger.h"
#include <algorithm>

namespace patternedge {
namespace analytics {

std::string toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BULL_LOW_VOL: return "bull_low_vol";
        case MarketRegime::BULL_HIGH_VOL: return "bull_high_vol";
        case MarketRegime::BEAR_LOW_VOL: return "bear_low_vol";
        case MarketRegime::BEAR_HIGH_VOL: return "bear_high_vol";
        case MarketRegime::EXTREME: return "extreme";
    }
    return "bull_low_vol";
}

RegimeDetector::RegimeDetector(engine::RegimeConfig config,
                               std::vector<DailyBar> index_bars,
                               std::vector<DailyBar> vix_bars)
    : config_(std::move(config))
    , index_bars_(std::move(index_bars))
    , vix_bars_(std::move(vix_bars)) {
    auto byDate = [](const DailyBar& a, const DailyBar& b) { return a.date < b.date; };
    std::sort(index_bars_.begin(), index_bars_.end(), byDate);
    std::sort(vix_bars_.begin(), vix_bars_.end(), byDate);

    if (index_bars_.size() < static_cast<std::size_t>(config_.dma_period)) {
        LOG_WARN("Regime: index series has {} bars (< {}), trend defaults to bull",
                 index_bars_.size(), config_.dma_period);
    }
    if (vix_bars_.empty()) {
        LOG_WARN("Regime: no volatility index data, volatility defaults to low_vol");
    }
}

std::size_t RegimeDetector::barsUpTo(const std::vector<DailyBar>& bars, const std::string& as_of) {
    if (as_of.empty()) {
        return bars.size();
    }
    const auto it = std::upper_bound(bars.begin(), bars.end(), as_of,
        [](const std::string& date, const DailyBar& bar) { return date < bar.date; });
    return static_cast<std::size_t>(it - bars.begin());
}

RegimeAnalysis RegimeDetector::detect(const std::string& as_of) const {
    RegimeAnalysis result;
    result.as_of = as_of;

    bool bull = true;
    const std::size_t n_index = barsUpTo(index_bars_, as_of);
    const auto period = static_cast<std::size_t>(config_.dma_period);
    if (n_index >= period) {
        double sum = 0.0;
        for (std::size_t i = n_index - period; i < n_index; ++i) {
            sum += index_bars_[i].close;
        }
        const double dma = sum / static_cast<double>(period);
        const double close = index_bars_[n_index - 1].close;
        bull = close >= dma;
        result.trend = bull ? "bull" : "bear";
        result.index_close = close;
        result.dma = dma;
        if (result.as_of.empty()) {
            result.as_of = index_bars_[n_index - 1].date;
        }
    }

    std::string vol = "low_vol";
    const std::size_t n_vix = barsUpTo(vix_bars_, as_of);
    if (n_vix > 0) {
        const double vix = vix_bars_[n_vix - 1].close;
        result.vix_value = vix;
        if (vix >= config_.vix_extreme) {
            vol = "extreme";
        } else if (vix >= config_.vix_high) {
            vol = "high_vol";
        }
        result.vol_level = vol;
    }

    if (vol == "extreme") {
        result.regime = MarketRegime::EXTREME;
    } else if (bull) {
        result.regime = (vol == "high_vol") ? MarketRegime::BULL_HIGH_VOL : MarketRegime::BULL_LOW_VOL;
    } else {
        result.regime = (vol == "high_vol") ? MarketRegime::BEAR_HIGH_VOL : MarketRegime::BEAR_LOW_VOL;
    }
    result.scale = scaleFor(result.regime);
    return result;
}

double RegimeDetector::scaleFor(MarketRegime regime, const std::string& horizon_label) const {
    if (regime == MarketRegime::EXTREME) {
        return 0.0;
    }
    const std::string label = toString(regime);
    if (!horizon_label.empty()) {
        const auto table = config_.horizon_scales.find(horizon_label);
        if (table != config_.horizon_scales.end()) {
            const auto it = table->second.find(label);
            if (it != table->second.end()) {
                return it->second;
            }
        }
    }
    const auto it = config_.scales.find(label);
    return it == config_.scales.end() ? 1.0 : it->second;
}

double RegimeDetector::horizonScale(const std::string& horizon_label, const std::string& as_of) const {
    return scaleFor(detect(as_of).regime, horizon_label);
}

std::vector<RegimeAnalysis> RegimeDetector::history(const std::string& from, const std::string& to) const {
    std::vector<RegimeAnalysis> out;
    for (const auto& bar : index_bars_) {
        if (bar.date < from || bar.date > to) {
            continue;
        }
        out.push_back(detect(bar.date));
    }
    return out;
}

} // namespace analytics
} // namespace patternedge
