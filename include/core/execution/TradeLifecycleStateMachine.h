#pragma once

#include <string>

#include "common/Types.h"

namespace patternedge {
namespace core {
namespace execution {

struct TradeTransitionResult {
    TradeStatus status = TradeStatus::OPEN;
    bool changed = false;
    bool terminal = false;
};

// OPEN -> CLOSED_SL | CLOSED_TARGET | CLOSED_EXPIRY | CANCELLED.
// Terminal states absorb every event.
class TradeLifecycleStateMachine {
public:
    // Events: "sl_hit", "target_hit", "expired", "cancel" (case-insensitive)
    static TradeTransitionResult transition(TradeStatus current, const std::string& event);
};

} // namespace execution
} // namespace core
} // namespace patternedge
