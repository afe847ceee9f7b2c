#include "data/ObservationFeed.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace patternedge {
namespace data {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

// Strings, numbers and null all show up in exported feeds
std::string stringField(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

bool numberField(const nlohmann::json& j, const std::string& key, double& out) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (it->is_number()) {
        out = it->get<double>();
        return true;
    }
    if (it->is_string()) {
        try {
            out = std::stod(it->get<std::string>());
            return true;
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return false;
        }
    }
    return false;
}

} // namespace

ObservationFeed::ObservationFeed(engine::DomainConfig domain, std::vector<int> horizons, int primary_horizon)
    : domain_(std::move(domain))
    , horizons_(std::move(horizons))
    , primary_horizon_(primary_horizon)
{
    for (auto& name : domain_.excluded_instruments) name = toLower(name);
    for (auto& name : domain_.allowed_instruments) name = toLower(name);
}

std::vector<std::string> ObservationFeed::splitPatterns(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

bool ObservationFeed::isAllowedInstrument(const std::string& instrument) const {
    const std::string key = toLower(instrument);
    if (contains(domain_.excluded_instruments, key)) {
        return false;
    }
    return domain_.allowed_instruments.empty() || contains(domain_.allowed_instruments, key);
}

std::string ObservationFeed::sectorFor(const std::string& instrument) const {
    const auto it = domain_.instrument_sectors.find(toLower(instrument));
    return it == domain_.instrument_sectors.end() ? "unknown" : it->second;
}

analytics::Observation ObservationFeed::parseRecord(const nlohmann::json& r) const {
    if (!r.is_object()) {
        throw std::invalid_argument("observation record is not an object");
    }

    analytics::Observation obs;
    obs.source_id = stringField(r, "id");

    const auto patterns = r.find("patterns");
    if (patterns != r.end() && patterns->is_array()) {
        for (const auto& p : *patterns) {
            if (p.is_string() && !trim(p.get<std::string>()).empty()) {
                obs.patterns.push_back(trim(p.get<std::string>()));
            }
        }
    } else {
        obs.patterns = splitPatterns(stringField(r, "patterns"));
    }
    if (obs.patterns.empty()) {
        throw std::invalid_argument("observation without patterns");
    }

    obs.instrument = toLower(stringField(r, "instrument"));
    if (obs.instrument.empty()) {
        throw std::invalid_argument("observation without instrument");
    }
    obs.sector = toLower(stringField(r, "sector"));
    if (obs.sector.empty()) {
        obs.sector = sectorFor(obs.instrument);
    }
    obs.timeframe = stringField(r, "timeframe");
    obs.trend = stringField(r, "trend_short");
    obs.volatility_zone = stringField(r, "volatility_zone");
    obs.price_position = stringField(r, "price_position");
    obs.market_regime = stringField(r, "market_regime");
    obs.timestamp = stringField(r, "datetime");

    numberField(r, "close", obs.close);
    numberField(r, "atr_14", obs.atr);
    if (!numberField(r, "vol_ratio", obs.volume_ratio)) {
        obs.volume_ratio = 1.0;
    }

    for (const int h : horizons_) {
        const std::string n = std::to_string(h);
        analytics::HorizonOutcome outcome;
        if (!numberField(r, "fwd_" + n + "_return_pct", outcome.return_pct)) {
            continue;
        }
        const std::string dir = stringField(r, ("fwd_" + n + "_direction").c_str());
        if (dir.empty()) {
            continue;
        }
        outcome.direction = directionFromString(dir);
        numberField(r, "mfe_" + n, outcome.mfe_pct);
        numberField(r, "mae_" + n, outcome.mae_pct);
        obs.outcomes[h] = outcome;
    }
    return obs;
}

std::vector<analytics::Observation> ObservationFeed::parse(const nlohmann::json& records, bool require_outcomes,
                                                           FeedStats* stats) const {
    FeedStats local;
    std::vector<analytics::Observation> out;
    if (!records.is_array()) {
        throw std::runtime_error("observation feed must be a JSON array");
    }

    for (const auto& r : records) {
        local.total++;
        analytics::Observation obs;
        try {
            obs = parseRecord(r);
        } catch (const std::invalid_argument&) {
            local.malformed++;
            continue;
        }
        if (!isAllowedInstrument(obs.instrument)) {
            local.excluded_instrument++;
            continue;
        }
        if (!domain_.allowed_timeframes.empty() && !contains(domain_.allowed_timeframes, obs.timeframe)) {
            local.excluded_timeframe++;
            continue;
        }
        if (require_outcomes && obs.outcome(primary_horizon_) == nullptr) {
            local.missing_outcome++;
            continue;
        }
        out.push_back(std::move(obs));
        local.loaded++;
    }

    if (stats) {
        *stats = local;
    }
    return out;
}

std::vector<analytics::Observation> ObservationFeed::loadFile(const std::string& file_path, bool require_outcomes,
                                                              FeedStats* stats) const {
    std::ifstream in(file_path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open observation feed: " + file_path);
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("malformed observation feed " + file_path + ": " + e.what());
    }

    FeedStats local;
    auto out = parse(raw, require_outcomes, &local);
    LOG_INFO("Loaded {} of {} observations from {} (excluded: {} instrument, {} timeframe, {} no outcome, {} malformed)",
             local.loaded, local.total, file_path, local.excluded_instrument, local.excluded_timeframe,
             local.missing_outcome, local.malformed);
    if (stats) {
        *stats = local;
    }
    return out;
}

std::vector<analytics::Observation> ObservationFeed::loadHistory(const std::string& file_path, FeedStats* stats) const {
    return loadFile(file_path, true, stats);
}

std::vector<analytics::Observation> ObservationFeed::loadLive(const std::string& file_path, FeedStats* stats) const {
    return loadFile(file_path, false, stats);
}

} // namespace data
} // namespace patternedge
