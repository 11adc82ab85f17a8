#pragma once

#include "qless/domain/order.hpp"
#include "qless/eventbus/event_bus.hpp"
#include "qless/events/event_types.hpp"
#include "qless/queue/queue_position_calculator.hpp"
#include "qless/repository/i_order_repository.hpp"
#include "qless/transport/i_transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace qless {

// -----------------------------------------------------------------------------
// QueueBroadcaster — fans the live queue out to every observer
// -----------------------------------------------------------------------------
//
// @brief  On every order event, reads one snapshot of the active set, ranks
//         it, and publishes it on three audiences.
//
// @details
// Per broadcast cycle:
//
//   1. listActive(): exactly one repository read.
//   2. QueuePositionCalculator::rankAll(): positions 1..n.
//   3. One JSON board [{orderId, status, displayName, queuePosition}, …]
//      in ascending position, then:
//        "global"      {"event":"queue:update",   "data": board}
//        "order:{id}"  {"event":"queue:position", "data": {orderId, status,
//                                                          queuePosition}}
//                      for each active order
//        "kitchen"     {"event":"kitchen:queue",  "data": board}
//
// All three audiences are fed from the same board built from the same read,
// so a customer's device and the kitchen display can never disagree about an
// order within one cycle.
//
// When an OrderStatusChangedEvent reports arrival at Ready, the order's own
// channel first gets {"event":"order:ready","data":{"orderId":…}} and a final
// queue:position with "queuePosition": null. The regular cycle follows, in
// which the order no longer appears.
//
// Every cycle is a full, self-contained snapshot. A client that missed one
// simply applies the next; there are no deltas to replay.
//
// Failure policy:
//   Every transport publish is isolated. NotificationDeliveryFailure (or any
//   other std::exception) is logged to stderr, counted, and swallowed; the
//   remaining publishes of the cycle still run. A failing snapshot read
//   skips the cycle. Nothing propagates to the code that emitted the event.
//
// Thread model:
//   Subscribes to the EventBus of the notification EventLoopThread, so all
//   cycles run on that one thread and never interleave. broadcastQueue() is
//   also safe to call directly (tests, startup).
//
// Ownership:
//   Owned by OrderService via std::unique_ptr, one per process. Holds
//   references to the bus, repository and transport; must be destroyed
//   before any of them.
// -----------------------------------------------------------------------------
class QueueBroadcaster {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Subscribes to OrderCreatedEvent and OrderStatusChangedEvent on
  //         bus.
  // -------------------------------------------------------------------------
  QueueBroadcaster(EventBus& bus, const IOrderRepository& repository,
                   ITransport& transport);

  // Unsubscribes both callbacks.
  ~QueueBroadcaster();

  QueueBroadcaster(const QueueBroadcaster&) = delete;
  QueueBroadcaster& operator=(const QueueBroadcaster&) = delete;
  QueueBroadcaster(QueueBroadcaster&&) = delete;
  QueueBroadcaster& operator=(QueueBroadcaster&&) = delete;

  // -------------------------------------------------------------------------
  // broadcastQueue()
  // -------------------------------------------------------------------------
  // @brief  Runs one full snapshot cycle (steps 1–3 above).
  // -------------------------------------------------------------------------
  void broadcastQueue();

  // -------------------------------------------------------------------------
  // notifyOrderReady(order)
  // -------------------------------------------------------------------------
  // @brief  Sends the one-shot pickup alert and the final null-position
  //         update to order's own channel only.
  // -------------------------------------------------------------------------
  void notifyOrderReady(const domain::Order& order);

  // Publishes that threw since construction.
  std::uint64_t deliveryFailures() const { return delivery_failures_.load(); }

  // Completed snapshot cycles since construction.
  std::uint64_t cycles() const { return cycles_.load(); }

  // Builders for the payloads above; exposed for the command layer's
  // "list_active" view and for tests.
  static nlohmann::json buildBoard(const std::vector<QueueEntry>& entries);
  static std::string envelope(const char* event, const nlohmann::json& data);

 private:
  void onOrderCreated(const OrderCreatedEvent& event);
  void onStatusChanged(const OrderStatusChangedEvent& event);

  // publish() wrapped in the failure policy.
  void publishSafely(const std::string& channel, const std::string& message);

  EventBus& bus_;
  const IOrderRepository& repository_;
  ITransport& transport_;

  EventBus::SubscriptionId created_sub_id_{0};
  EventBus::SubscriptionId changed_sub_id_{0};

  std::atomic<std::uint64_t> delivery_failures_{0};
  std::atomic<std::uint64_t> cycles_{0};
};

}  // namespace qless
