#pragma once

#include "qless/domain/order.hpp"
#include "qless/domain/order_status.hpp"

namespace qless {

// -----------------------------------------------------------------------------
// OrderCreatedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces that a new order was stored. Published by
// OrderService after the repository insert succeeded.
// The new order joins the active set, which changes the queue every
// observer is looking at. The QueueBroadcaster reacts on the notification
// thread.
// -----------------------------------------------------------------------------
struct OrderCreatedEvent {
  domain::Order order;  // Snapshot as stored
};

// -----------------------------------------------------------------------------
// OrderStatusChangedEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces one applied status transition. Published by the
// OrderStateMachine after the repository compare-and-swap succeeded.
//
// @details
// order is the record after the transition; previous_status is what it
// moved from. The QueueBroadcaster uses both: leaving Preparing shrinks the
// queue for everyone behind the order, and arriving at Ready additionally
// triggers the one-shot pickup notification on the order's own channel.
// -----------------------------------------------------------------------------
struct OrderStatusChangedEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
};

}  // namespace qless
