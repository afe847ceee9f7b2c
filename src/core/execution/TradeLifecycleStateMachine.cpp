#include "core/execution/TradeLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace patternedge {
namespace core {
namespace execution {

namespace {
std::string normalizeEvent(std::string event) {
    std::transform(event.begin(), event.end(), event.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return event;
}
} // namespace

TradeTransitionResult TradeLifecycleStateMachine::transition(TradeStatus current, const std::string& event) {
    TradeTransitionResult result;
    result.status = current;
    result.terminal = isTerminal(current);
    if (result.terminal) {
        return result;
    }

    const std::string normalized_event = normalizeEvent(event);

    if (normalized_event == "sl_hit" || normalized_event == "stop_loss") {
        result.status = TradeStatus::CLOSED_SL;
    } else if (normalized_event == "target_hit" || normalized_event == "target") {
        result.status = TradeStatus::CLOSED_TARGET;
    } else if (normalized_event == "expired" || normalized_event == "expiry") {
        result.status = TradeStatus::CLOSED_EXPIRY;
    } else if (normalized_event == "cancel" || normalized_event == "cancelled") {
        result.status = TradeStatus::CANCELLED;
    } else {
        return result;
    }

    result.changed = true;
    result.terminal = true;
    return result;
}

} // namespace execution
} // namespace core
} // namespace patternedge
