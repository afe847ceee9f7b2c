#pragma once

#include <string>
#include <vector>

namespace patternedge {
namespace utils {

// Calendar helpers over ISO "YYYY-MM-DD" strings.
// Trading days are Monday..Friday; exchange holidays are not modelled.
class DateUtils {
public:
    // Days since 1970-01-01. Throws std::invalid_argument on malformed input.
    static long long toDayNumber(const std::string& iso_date);
    static std::string fromDayNumber(long long day_number);

    // Accepts "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS", returns the date part
    static std::string datePart(const std::string& timestamp);
    static std::string monthOf(const std::string& iso_date);
    static std::string dateFromMs(long long epoch_ms);
    static long long startOfDayMs(const std::string& iso_date);

    static bool isValidDate(const std::string& iso_date);
    static bool isTradingDay(const std::string& iso_date);
    static std::string addDays(const std::string& iso_date, int days);
    static std::string addTradingDays(const std::string& iso_date, int trading_days);
    static long long daysBetween(const std::string& from, const std::string& to);

    // Trading days in (from, to], ascending
    static std::vector<std::string> tradingDaysAfter(const std::string& from, const std::string& to);
};

} // namespace utils
} // namespace patternedge
