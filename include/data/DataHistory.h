#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IMarketDataSource.h"

namespace patternedge {
namespace data {

// Daily bars from <bars_dir>/<instrument>.csv, loaded lazily and cached
class DataHistory : public core::IMarketDataSource {
public:
    explicit DataHistory(std::string bars_dir = "");

    std::vector<DailyBar> bars(const std::string& instrument,
                               const std::string& from,
                               const std::string& to) const override;

    // All bars of an instrument, ascending
    std::vector<DailyBar> history(const std::string& instrument) const;

    // Registers in-memory bars, replacing anything loaded for the instrument
    void setBars(const std::string& instrument, std::vector<DailyBar> bars);

    // Expected format: date,open,high,low,close,volume (header optional)
    static std::vector<DailyBar> loadCSV(const std::string& file_path);

    // Inclusive ISO date range
    static std::vector<DailyBar> filterByDate(const std::vector<DailyBar>& bars,
                                              const std::string& start_date,
                                              const std::string& end_date);

private:
    const std::vector<DailyBar>& cached(const std::string& instrument) const;

    std::string bars_dir_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, std::vector<DailyBar>> cache_;
};

} // namespace data
} // namespace patternedge
