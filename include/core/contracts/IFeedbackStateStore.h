#pragma once

#include <cstdint>
#include <optional>

#include "engine/FeedbackTypes.h"

namespace patternedge {
namespace core {

class IFeedbackStateStore {
public:
    virtual ~IFeedbackStateStore() = default;

    virtual std::optional<engine::FeedbackSnapshot> load() = 0;

    // False on I/O failure, VersionConflictError on a stale expected_version
    virtual bool save(const engine::FeedbackSnapshot& snapshot, std::uint64_t expected_version) = 0;
};

} // namespace core
} // namespace patternedge
