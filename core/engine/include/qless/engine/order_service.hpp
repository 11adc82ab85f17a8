#pragma once

#include "qless/broadcast/queue_broadcaster.hpp"
#include "qless/cart/i_cart_store.hpp"
#include "qless/catalog/i_catalog.hpp"
#include "qless/concurrent/event_loop_thread.hpp"
#include "qless/concurrent/order_id_generator.hpp"
#include "qless/concurrent/sequencer.hpp"
#include "qless/domain/order.hpp"
#include "qless/repository/i_order_repository.hpp"
#include "qless/state/order_state_machine.hpp"
#include "qless/time/i_time_provider.hpp"
#include "qless/transport/i_transport.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qless {

// One requested line of a new order, before the catalog snapshot is taken.
struct OrderItemRequest {
  std::string item_ref;
  int quantity{0};
};

// -----------------------------------------------------------------------------
// OrderView
// -----------------------------------------------------------------------------
// An order together with its live queue position. queue_position is empty
// for Ready and Completed orders.
// -----------------------------------------------------------------------------
struct OrderView {
  domain::Order order;
  std::optional<std::size_t> queue_position;
};

// -----------------------------------------------------------------------------
// OrderService
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator of the order queue. Owns the sequencing,
//         transition and notification machinery and exposes the operations
//         request handlers call.
//
// @details
// Provides a lifecycle API (start/stop) so that main() and tests can use the
// service without wiring internals by hand.
//
// Thread layout:
//
//   request threads     → createOrder / transition / queries (concurrent)
//   notify_loop thread  → QueueBroadcaster callbacks (one cycle at a time)
//
// Mutations never publish directly. They push an Event into notify_loop_
// and return; the broadcaster subscribed to that loop's bus reads the
// snapshot and fans it out. A slow or failing transport therefore never
// delays or fails an order operation.
//
// Ownership:
//   OrderService
//    ├── id_gen_         (OrderIdGenerator — value member)
//    ├── sequencer_      (Sequencer — value member)
//    ├── notify_loop_    (EventLoopThread — value member)
//    ├── broadcaster_    (unique_ptr<QueueBroadcaster>)
//    ├── state_machine_  (unique_ptr<OrderStateMachine>)
//    └── repository, catalog, cart, transport, clock  (non-owning refs)
//
// The broadcaster is declared after notify_loop_ so it is destroyed first
// and unsubscribes before the loop's bus goes away.
//
// Thread model:
//   Construct, start() and stop() on the owning thread. Every order
//   operation is safe to call concurrently from any thread.
// -----------------------------------------------------------------------------
class OrderService {
 public:
  struct Options {
    int max_transition_retries{OrderStateMachine::kDefaultMaxRetries};
    std::size_t history_limit{200};
    std::size_t owner_history_limit{50};
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  repository  Authoritative order store.
  // @param  catalog     Menu lookups for the line-item snapshot.
  // @param  cart        Source for createOrderFromCart().
  // @param  transport   Realtime fan-out used by the broadcaster.
  // @param  clock       Feeds the Sequencer and created_at / updated_at.
  //
  // All five must outlive the service. Builds the broadcaster and state
  // machine; spawns nothing. Events emitted before start() are held in the
  // loop's queue and broadcast once it starts.
  // -------------------------------------------------------------------------
  OrderService(IOrderRepository& repository, const ICatalog& catalog,
               ICartStore& cart, ITransport& transport,
               const ITimeProvider& clock);
  OrderService(IOrderRepository& repository, const ICatalog& catalog,
               ICartStore& cart, ITransport& transport,
               const ITimeProvider& clock, Options options);

  // Destructor calls stop() for RAII safety.
  ~OrderService();

  OrderService(const OrderService&) = delete;
  OrderService& operator=(const OrderService&) = delete;
  OrderService(OrderService&&) = delete;
  OrderService& operator=(OrderService&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // start() spawns the notification thread. stop() broadcasts every event
  // still pending, then joins it. Both idempotent; start() may follow
  // stop().
  // -------------------------------------------------------------------------
  void start();
  void stop();

  // -------------------------------------------------------------------------
  // createOrder(display_name, items, owner_ref)
  // -------------------------------------------------------------------------
  //
  // @brief  Places a new order at the back of the queue.
  //
  // @details
  // 1. Validates: blank display_name or a quantity < 1 → InvalidRequest;
  //    no items → EmptyOrder.
  // 2. Looks every item up in the catalog: unknown → NotFound, switched
  //    off → UnavailableItem. Any failure rejects the whole order.
  // 3. Snapshots name and unit price into the line items, sums the total
  //    once.
  // 4. Draws the CreationKey from the Sequencer and an id, stores the order
  //    as Pending, and queues an OrderCreatedEvent.
  //
  // @return The stored order and its queue position at return time.
  // -------------------------------------------------------------------------
  OrderView createOrder(const std::string& display_name,
                        const std::vector<OrderItemRequest>& items,
                        std::optional<std::string> owner_ref = std::nullopt);

  // -------------------------------------------------------------------------
  // createOrderFromCart(owner_ref, display_name)
  // -------------------------------------------------------------------------
  // Takes the owner's cart atomically and builds the order from it. An empty
  // cart is EmptyOrder. A rejected order puts its lines back in the cart;
  // lines added while the order was being built are kept.
  // -------------------------------------------------------------------------
  OrderView createOrderFromCart(const std::string& owner_ref,
                                const std::string& display_name);

  // @throws NotFound
  OrderView getOrder(domain::OrderId id) const;

  // Active orders, ascending creation key (= queue order).
  std::vector<domain::Order> listActive() const;

  // Most recent first; filter.limit is capped at Options::history_limit.
  std::vector<domain::Order> listHistory(HistoryFilter filter) const;

  // -------------------------------------------------------------------------
  // transition(id, requested)
  // -------------------------------------------------------------------------
  // Delegates to OrderStateMachine::transition(); see there for errors.
  // -------------------------------------------------------------------------
  domain::Order transition(domain::OrderId id, domain::OrderStatus requested);

  // -------------------------------------------------------------------------
  // listByOwner(owner_ref, status)
  // -------------------------------------------------------------------------
  // The owner's orders, most recent first, at most
  // Options::owner_history_limit, each with its live position. Positions
  // come from one listActive() read.
  // -------------------------------------------------------------------------
  std::vector<OrderView> listByOwner(
      const std::string& owner_ref,
      std::optional<domain::OrderStatus> status = std::nullopt) const;

  // Bus of the notification thread, for observers next to the broadcaster.
  EventBus& notificationBus() { return notify_loop_.eventBus(); }

  const QueueBroadcaster& broadcaster() const { return *broadcaster_; }

 private:
  domain::Order buildOrder(const std::string& display_name,
                           const std::vector<OrderItemRequest>& items,
                           std::optional<std::string> owner_ref);

  OrderView place(domain::Order order);

  std::optional<std::size_t> positionOf(const domain::Order& order) const;

  // --- Non-owning collaborators ---------------------------------------------
  IOrderRepository& repository_;
  const ICatalog& catalog_;
  ICartStore& cart_;
  ITransport& transport_;
  const ITimeProvider& clock_;

  Options options_;

  // --- Sequencing (value members) -------------------------------------------
  OrderIdGenerator id_gen_;
  Sequencer sequencer_;

  // --- Notification loop (destroyed after the broadcaster) ------------------
  EventLoopThread notify_loop_;

  // --- Logic components -----------------------------------------------------
  std::unique_ptr<QueueBroadcaster> broadcaster_;
  std::unique_ptr<OrderStateMachine> state_machine_;

  bool running_{false};
};

}  // namespace qless
