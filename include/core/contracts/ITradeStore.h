#pragma once

#include <cstdint>
#include <optional>

#include "core/model/Trade.h"

namespace patternedge {
namespace core {

class ITradeStore {
public:
    virtual ~ITradeStore() = default;

    virtual std::optional<TradeBook> load() = 0;
    virtual bool save(const TradeBook& book, std::uint64_t expected_version) = 0;
};

} // namespace core
} // namespace patternedge
