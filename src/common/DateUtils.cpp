#include "common/DateUtils.h"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace patternedge {
namespace utils {

namespace {
// Howard Hinnant's civil calendar conversions
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp + (mp < 10 ? 3 : -9);
    y += (m <= 2);
}

bool parseParts(const std::string& s, int& y, int& m, int& d) {
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') {
        return false;
    }
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    y = std::stoi(s.substr(0, 4));
    m = std::stoi(s.substr(5, 2));
    d = std::stoi(s.substr(8, 2));
    return m >= 1 && m <= 12 && d >= 1 && d <= 31;
}
} // namespace

long long DateUtils::toDayNumber(const std::string& iso_date) {
    int y = 0, m = 0, d = 0;
    if (!parseParts(iso_date, y, m, d)) {
        throw std::invalid_argument("invalid date: " + iso_date);
    }
    return daysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

std::string DateUtils::fromDayNumber(long long day_number) {
    long long y = 0;
    unsigned m = 0, d = 0;
    civilFromDays(day_number, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", y, m, d);
    return buf;
}

std::string DateUtils::datePart(const std::string& timestamp) {
    return timestamp.size() >= 10 ? timestamp.substr(0, 10) : timestamp;
}

std::string DateUtils::monthOf(const std::string& iso_date) {
    return iso_date.size() >= 7 ? iso_date.substr(0, 7) : iso_date;
}

std::string DateUtils::dateFromMs(long long epoch_ms) {
    long long days = epoch_ms / 86400000LL;
    if (epoch_ms < 0 && epoch_ms % 86400000LL != 0) {
        --days;
    }
    return fromDayNumber(days);
}

long long DateUtils::startOfDayMs(const std::string& iso_date) {
    return toDayNumber(iso_date) * 86400000LL;
}

bool DateUtils::isValidDate(const std::string& iso_date) {
    int y = 0, m = 0, d = 0;
    return parseParts(iso_date, y, m, d);
}

bool DateUtils::isTradingDay(const std::string& iso_date) {
    // 1970-01-01 was a Thursday
    const long long dn = toDayNumber(iso_date);
    const long long weekday = ((dn % 7) + 7 + 3) % 7; // 0 = Monday
    return weekday < 5;
}

std::string DateUtils::addDays(const std::string& iso_date, int days) {
    return fromDayNumber(toDayNumber(iso_date) + days);
}

std::string DateUtils::addTradingDays(const std::string& iso_date, int trading_days) {
    long long dn = toDayNumber(iso_date);
    int added = 0;
    while (added < trading_days) {
        ++dn;
        if (isTradingDay(fromDayNumber(dn))) {
            ++added;
        }
    }
    return fromDayNumber(dn);
}

long long DateUtils::daysBetween(const std::string& from, const std::string& to) {
    return toDayNumber(to) - toDayNumber(from);
}

std::vector<std::string> DateUtils::tradingDaysAfter(const std::string& from, const std::string& to) {
    std::vector<std::string> out;
    const long long end = toDayNumber(to);
    for (long long dn = toDayNumber(from) + 1; dn <= end; ++dn) {
        const std::string day = fromDayNumber(dn);
        if (isTradingDay(day)) {
            out.push_back(day);
        }
    }
    return out;
}

} // namespace utils
} // namespace patternedge
