#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/Observation.h"
#include "engine/EngineConfig.h"

namespace patternedge {
namespace data {

struct FeedStats {
    int total = 0;
    int loaded = 0;
    int excluded_instrument = 0;
    int excluded_timeframe = 0;
    int missing_outcome = 0;
    int malformed = 0;
};

// Reads observation records (JSON array) and applies the domain filters
class ObservationFeed {
public:
    ObservationFeed(engine::DomainConfig domain, std::vector<int> horizons, int primary_horizon);

    // Historical records need a primary-horizon return and direction.
    // Throws std::runtime_error when the file cannot be opened or parsed.
    std::vector<analytics::Observation> loadHistory(const std::string& file_path, FeedStats* stats = nullptr) const;

    // Live records: outcomes optional
    std::vector<analytics::Observation> loadLive(const std::string& file_path, FeedStats* stats = nullptr) const;

    std::vector<analytics::Observation> parse(const nlohmann::json& records, bool require_outcomes,
                                              FeedStats* stats = nullptr) const;

    // Throws std::invalid_argument on a malformed record
    analytics::Observation parseRecord(const nlohmann::json& record) const;

    bool isAllowedInstrument(const std::string& instrument) const;
    std::string sectorFor(const std::string& instrument) const;

    static std::vector<std::string> splitPatterns(const std::string& value);

private:
    std::vector<analytics::Observation> loadFile(const std::string& file_path, bool require_outcomes,
                                                 FeedStats* stats) const;

    engine::DomainConfig domain_;
    std::vector<int> horizons_;
    int primary_horizon_;
};

} // namespace data
} // namespace patternedge
