#include "data/DataHistory.h"
#include "common/DateUtils.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
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
} // namespace

DataHistory::DataHistory(std::string bars_dir)
    : bars_dir_(std::move(bars_dir)) {}

std::vector<DailyBar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<DailyBar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    int skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 5) continue;
        const std::string date = utils::DateUtils::datePart(row[0]);
        if (!utils::DateUtils::isValidDate(date)) {
            // Header or malformed row.
            continue;
        }

        try {
            DailyBar bar;
            bar.date = date;
            bar.open = std::stod(row[1]);
            bar.high = std::stod(row[2]);
            bar.low = std::stod(row[3]);
            bar.close = std::stod(row[4]);
            bar.volume = row.size() > 5 && !row[5].empty() ? std::stod(row[5]) : 0.0;
            bars.push_back(bar);
        } catch (const std::invalid_argument&) {
            ++skipped;
        } catch (const std::out_of_range&) {
            ++skipped;
        }
    }

    std::stable_sort(bars.begin(), bars.end(), [](const DailyBar& a, const DailyBar& b) {
        return a.date < b.date;
    });
    bars.erase(std::unique(bars.begin(), bars.end(), [](const DailyBar& a, const DailyBar& b) {
        return a.date == b.date;
    }), bars.end());

    if (skipped > 0) {
        LOG_WARN("{}: skipped {} unparsable rows", file_path, skipped);
    }
    return bars;
}

std::vector<DailyBar> DataHistory::filterByDate(const std::vector<DailyBar>& bars,
                                                const std::string& start_date,
                                                const std::string& end_date) {
    std::vector<DailyBar> out;
    for (const auto& bar : bars) {
        if (!start_date.empty() && bar.date < start_date) continue;
        if (!end_date.empty() && bar.date > end_date) continue;
        out.push_back(bar);
    }
    return out;
}

const std::vector<DailyBar>& DataHistory::cached(const std::string& instrument) const {
    const std::string key = toLower(instrument);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }

    std::vector<DailyBar> loaded;
    if (!bars_dir_.empty()) {
        const auto path = std::filesystem::path(bars_dir_) / (key + ".csv");
        if (std::filesystem::exists(path)) {
            loaded = loadCSV(path.string());
            LOG_INFO("Loaded {} bars for {}", loaded.size(), key);
        } else {
            LOG_WARN("No bar file for {} ({})", key, path.string());
        }
    }
    return cache_.emplace(key, std::move(loaded)).first->second;
}

std::vector<DailyBar> DataHistory::bars(const std::string& instrument,
                                        const std::string& from,
                                        const std::string& to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filterByDate(cached(instrument), from, to);
}

std::vector<DailyBar> DataHistory::history(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached(instrument);
}

void DataHistory::setBars(const std::string& instrument, std::vector<DailyBar> bars) {
    std::sort(bars.begin(), bars.end(), [](const DailyBar& a, const DailyBar& b) {
        return a.date < b.date;
    });
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[toLower(instrument)] = std::move(bars);
}

} // namespace data
} // namespace patternedge
