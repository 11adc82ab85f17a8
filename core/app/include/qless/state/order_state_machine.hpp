#pragma once

#include "qless/domain/order.hpp"
#include "qless/domain/order_status.hpp"
#include "qless/events/event.hpp"
#include "qless/repository/i_order_repository.hpp"
#include "qless/time/i_time_provider.hpp"

#include <functional>
#include <vector>

namespace qless {

// -----------------------------------------------------------------------------
// OrderStateMachine — the authority on order status transitions
// -----------------------------------------------------------------------------
//
// @brief  Validates a requested status change against the pipeline, applies
//         it through the repository's compare-and-swap, and emits an
//         OrderStatusChangedEvent.
//
// @details
// Legal transitions:
//   Pending    → Preparing
//   Preparing  → Ready
//   Ready      → Completed
//   Completed  → (none, terminal)
//
// No skips, no reversals, no self-transitions.
//
// transition() always re-reads the order from the repository and checks the
// transition against that authoritative status, then asks the repository to
// swap expected → requested. If another request advanced the order in
// between, the repository throws ConflictError; the machine re-reads and
// re-checks, up to max_retries extra attempts. A retry usually resolves to
// InvalidTransition (the order already moved past the requested step) and
// occasionally to success (the racer moved it into the expected state).
//
// Emission rule, in one place: every applied transition emits exactly one
// OrderStatusChangedEvent through the sink. The QueueBroadcaster derives
// both the queue snapshot and, for arrivals at Ready, the pickup
// notification from that event.
//
// Thread model:
//   transition() is safe to call concurrently from any request thread. The
//   machine holds no mutable state of its own; serialization per order is
//   the repository's compare-and-swap.
//
// Ownership:
//   Owned by OrderService. Holds references to the repository and clock,
//   both of which must outlive it.
// -----------------------------------------------------------------------------
class OrderStateMachine {
 public:
  using EventSink = std::function<void(Event)>;

  static constexpr int kDefaultMaxRetries = 3;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  repository   Authoritative order store.
  // @param  clock        Source for updated_at.
  // @param  event_sink   Receives one OrderStatusChangedEvent per applied
  //                      transition. In the service this pushes into the
  //                      notification EventLoopThread; tests may publish
  //                      straight onto an EventBus.
  // @param  max_retries  Extra attempts after a ConflictError.
  // -------------------------------------------------------------------------
  OrderStateMachine(IOrderRepository& repository, const ITimeProvider& clock,
                    EventSink event_sink,
                    int max_retries = kDefaultMaxRetries);

  OrderStateMachine(const OrderStateMachine&) = delete;
  OrderStateMachine& operator=(const OrderStateMachine&) = delete;

  // -------------------------------------------------------------------------
  // transition(id, requested)
  // -------------------------------------------------------------------------
  // @brief  Moves order id to requested if the pipeline allows it.
  //
  // @return The order after the transition.
  //
  // @throws NotFound           no order has this id.
  // @throws InvalidTransition  requested is not the next step from the
  //                            current status; carries current + allowed.
  // @throws ConflictError      lost the race on every attempt.
  //
  // On any throw the stored status is unchanged by this call and nothing is
  // emitted.
  // -------------------------------------------------------------------------
  domain::Order transition(domain::OrderId id, domain::OrderStatus requested);

  // -------------------------------------------------------------------------
  // allowedNext(status) / isLegal(from, to)
  // -------------------------------------------------------------------------
  // Pure functions of the transition table.
  // -------------------------------------------------------------------------
  static std::vector<domain::OrderStatus> allowedNext(
      domain::OrderStatus status);
  static bool isLegal(domain::OrderStatus from, domain::OrderStatus to);

 private:
  void emit(const domain::Order& order, domain::OrderStatus previous);

  IOrderRepository& repository_;
  const ITimeProvider& clock_;
  EventSink event_sink_;
  int max_retries_;
};

}  // namespace qless
