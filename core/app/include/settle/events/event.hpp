#pragma once

#include "settle/events/event_types.hpp"

#include <variant>

namespace settle {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus and the IPC telemetry queue.
// Subscribers use EventBus::subscribe<T>() or std::get_if / std::visit.
// Adding a notification kind means adding it here and to eventToJson().
// -----------------------------------------------------------------------------
using Event = std::variant<
    SettlementCreatedEvent,
    DepositReceivedEvent,
    SettlementInitiatedEvent,
    TransfersExecutedEvent,
    SettlementFinalizedEvent,
    SettlementRefundedEvent,
    SettlementDisputedEvent,
    DisputeResolvedEvent,
    PauseChangedEvent>;

}  // namespace settle
