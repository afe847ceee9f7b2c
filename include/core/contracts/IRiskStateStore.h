#pragma once

#include <cstdint>
#include <optional>

#include "risk/RiskState.h"

namespace patternedge {
namespace core {

class IRiskStateStore {
public:
    virtual ~IRiskStateStore() = default;

    virtual std::optional<risk::RiskState> load() = 0;

    // False on I/O failure. Throws VersionConflictError when the stored
    // version differs from expected_version.
    virtual bool save(const risk::RiskState& state, std::uint64_t expected_version) = 0;
};

} // namespace core
} // namespace patternedge
