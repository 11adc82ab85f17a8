#pragma once

#include "qless/events/event_types.hpp"

#include <variant>

namespace qless {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope carried by the EventBus and the
// notification EventLoopThread.
//
// std::variant keeps events as plain values: they are copied across the
// request-thread → notification-thread boundary with no shared mutable state
// and no heap-allocated base classes. Subscribers dispatch with
// EventBus::subscribe<T>() or std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<OrderCreatedEvent, OrderStatusChangedEvent>;

}  // namespace qless
