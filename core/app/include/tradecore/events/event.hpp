#pragma once

#include "tradecore/events/event_types.hpp"

#include <variant>

namespace tradecore {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The envelope carried by EventBus. A closed std::variant: subscribers
// dispatch with std::get_if or EventBus::subscribe<T>, and adding a new event
// kind means adding it here.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SignalEvent,
    RiskRejectEvent,
    OrderSubmittedEvent,
    OrderFailedEvent,
    PositionUpdateEvent,
    OrderCompletedEvent,
    LoopFaultEvent>;

}  // namespace tradecore
