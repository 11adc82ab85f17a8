#include "qless/broadcast/queue_broadcaster.hpp"
#include "qless/broadcast/channel_keys.hpp"
#include "qless/serialization/order_json.hpp"

#include <iostream>

namespace qless {

// -----------------------------------------------------------------------------
// Constructor: subscribe to both order events
// -----------------------------------------------------------------------------
QueueBroadcaster::QueueBroadcaster(EventBus& bus,
                                   const IOrderRepository& repository,
                                   ITransport& transport)
    : bus_(bus), repository_(repository), transport_(transport) {
  created_sub_id_ = bus_.subscribe<OrderCreatedEvent>(
      [this](const OrderCreatedEvent& e) { onOrderCreated(e); });

  changed_sub_id_ = bus_.subscribe<OrderStatusChangedEvent>(
      [this](const OrderStatusChangedEvent& e) { onStatusChanged(e); });
}

QueueBroadcaster::~QueueBroadcaster() {
  bus_.unsubscribe(changed_sub_id_);
  bus_.unsubscribe(created_sub_id_);
}

// -----------------------------------------------------------------------------
// onOrderCreated: a new order joined the active set
// -----------------------------------------------------------------------------
void QueueBroadcaster::onOrderCreated(const OrderCreatedEvent& /*event*/) {
  broadcastQueue();
}

// -----------------------------------------------------------------------------
// onStatusChanged: pickup alert first (if Ready), then the snapshot
// -----------------------------------------------------------------------------
void QueueBroadcaster::onStatusChanged(const OrderStatusChangedEvent& event) {
  if (event.order.status == domain::OrderStatus::Ready) {
    notifyOrderReady(event.order);
  }
  broadcastQueue();
}

// -----------------------------------------------------------------------------
// broadcastQueue: one read, one board, three audiences
// -----------------------------------------------------------------------------
void QueueBroadcaster::broadcastQueue() {
  std::vector<domain::Order> active;
  try {
    active = repository_.listActive();
  } catch (const std::exception& e) {
    std::cerr << "[QueueBroadcaster] WARNING: snapshot read failed: "
              << e.what() << ". Skipping cycle.\n";
    return;
  }

  const std::vector<QueueEntry> entries =
      QueuePositionCalculator::rankAll(std::move(active));
  const nlohmann::json board = buildBoard(entries);

  publishSafely(kGlobalChannel, envelope(kQueueUpdateEvent, board));

  for (const auto& entry : entries) {
    nlohmann::json data;
    data["orderId"] = idToString(entry.order.id);
    data["status"] = domain::toString(entry.order.status);
    data["queuePosition"] = entry.position;
    publishSafely(orderChannel(entry.order.id),
                  envelope(kQueuePositionEvent, data));
  }

  publishSafely(kKitchenChannel, envelope(kKitchenQueueEvent, board));

  cycles_.fetch_add(1);
}

// -----------------------------------------------------------------------------
// notifyOrderReady: targeted, one-shot
// -----------------------------------------------------------------------------
void QueueBroadcaster::notifyOrderReady(const domain::Order& order) {
  const std::string channel = orderChannel(order.id);

  nlohmann::json ready;
  ready["orderId"] = idToString(order.id);
  publishSafely(channel, envelope(kOrderReadyEvent, ready));

  nlohmann::json final_position;
  final_position["orderId"] = idToString(order.id);
  final_position["status"] = domain::toString(order.status);
  final_position["queuePosition"] = nullptr;
  publishSafely(channel, envelope(kQueuePositionEvent, final_position));
}

// -----------------------------------------------------------------------------
// buildBoard(): [{orderId, status, displayName, queuePosition}, …]
// -----------------------------------------------------------------------------
nlohmann::json QueueBroadcaster::buildBoard(
    const std::vector<QueueEntry>& entries) {
  nlohmann::json board = nlohmann::json::array();
  for (const auto& entry : entries) {
    nlohmann::json j;
    j["orderId"] = idToString(entry.order.id);
    j["status"] = domain::toString(entry.order.status);
    j["displayName"] = entry.order.display_name;
    j["queuePosition"] = entry.position;
    board.push_back(std::move(j));
  }
  return board;
}

std::string QueueBroadcaster::envelope(const char* event,
                                       const nlohmann::json& data) {
  nlohmann::json j;
  j["event"] = event;
  j["data"] = data;
  return j.dump();
}

// -----------------------------------------------------------------------------
// publishSafely(): log, count, swallow
// -----------------------------------------------------------------------------
void QueueBroadcaster::publishSafely(const std::string& channel,
                                     const std::string& message) {
  try {
    transport_.publish(channel, message);
  } catch (const std::exception& e) {
    delivery_failures_.fetch_add(1);
    std::cerr << "[QueueBroadcaster] WARNING: publish to " << channel
              << " failed: " << e.what() << "\n";
  }
}

}  // namespace qless
