#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace patternedge {
namespace core {

class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    // Daily bars with from <= date <= to, ascending. Empty when unknown.
    virtual std::vector<DailyBar> bars(const std::string& instrument,
                                       const std::string& from,
                                       const std::string& to) const = 0;
};

} // namespace core
} // namespace patternedge
