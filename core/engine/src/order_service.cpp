#include "qless/engine/order_service.hpp"
#include "qless/errors/order_errors.hpp"
#include "qless/events/event_types.hpp"
#include "qless/queue/queue_position_calculator.hpp"
#include "qless/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace qless {

namespace {

bool isBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
OrderService::OrderService(IOrderRepository& repository,
                           const ICatalog& catalog, ICartStore& cart,
                           ITransport& transport, const ITimeProvider& clock)
    : OrderService(repository, catalog, cart, transport, clock, Options{}) {}

OrderService::OrderService(IOrderRepository& repository,
                           const ICatalog& catalog, ICartStore& cart,
                           ITransport& transport, const ITimeProvider& clock,
                           Options options)
    : repository_(repository),
      catalog_(catalog),
      cart_(cart),
      transport_(transport),
      clock_(clock),
      options_(options),
      sequencer_(clock) {
  broadcaster_ = std::make_unique<QueueBroadcaster>(
      notify_loop_.eventBus(), repository_, transport_);

  state_machine_ = std::make_unique<OrderStateMachine>(
      repository_, clock_,
      [this](Event event) { notify_loop_.push(std::move(event)); },
      options_.max_transition_retries);
}

OrderService::~OrderService() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void OrderService::start() {
  if (running_) {
    return;
  }
  notify_loop_.start();
  running_ = true;

  std::cout << "[OrderService] started. max_transition_retries="
            << options_.max_transition_retries << "\n";
}

void OrderService::stop() {
  if (!running_) {
    return;
  }
  notify_loop_.stop();
  running_ = false;

  std::cout << "[OrderService] stopped. broadcast cycles="
            << broadcaster_->cycles()
            << " delivery failures=" << broadcaster_->deliveryFailures()
            << " merged creation triggers=" << notify_loop_.coalescedCount()
            << "\n";
}

// -----------------------------------------------------------------------------
// createOrder()
// -----------------------------------------------------------------------------
OrderView OrderService::createOrder(const std::string& display_name,
                                    const std::vector<OrderItemRequest>& items,
                                    std::optional<std::string> owner_ref) {
  return place(buildOrder(display_name, items, std::move(owner_ref)));
}

// -----------------------------------------------------------------------------
// createOrderFromCart(): take the lines, give them back on rejection
// -----------------------------------------------------------------------------
OrderView OrderService::createOrderFromCart(const std::string& owner_ref,
                                            const std::string& display_name) {
  const std::vector<CartLine> lines = cart_.take(owner_ref);
  if (lines.empty()) {
    throw EmptyOrder("Cart of " + owner_ref + " is empty.");
  }

  std::vector<OrderItemRequest> items;
  items.reserve(lines.size());
  for (const auto& line : lines) {
    items.push_back(OrderItemRequest{line.item_ref, line.quantity});
  }

  try {
    return place(buildOrder(display_name, items, owner_ref));
  } catch (...) {
    cart_.restore(owner_ref, lines);
    throw;
  }
}

// -----------------------------------------------------------------------------
// buildOrder(): validate, snapshot prices, sum once
// -----------------------------------------------------------------------------
domain::Order OrderService::buildOrder(
    const std::string& display_name,
    const std::vector<OrderItemRequest>& items,
    std::optional<std::string> owner_ref) {
  if (isBlank(display_name)) {
    throw InvalidRequest("display_name must not be empty.");
  }
  if (items.empty()) {
    throw EmptyOrder("Order has no items.");
  }

  domain::Order order;
  order.owner_ref = std::move(owner_ref);
  order.display_name = display_name;
  order.line_items.reserve(items.size());

  for (const auto& item : items) {
    if (item.quantity < 1) {
      throw InvalidRequest("Quantity for item " + item.item_ref +
                           " must be at least 1.");
    }
    auto entry = catalog_.lookup(item.item_ref);
    if (!entry) {
      throw NotFound("Menu item " + item.item_ref + " not found.");
    }
    if (!entry->is_available) {
      throw UnavailableItem("Menu item " + entry->name +
                            " is currently unavailable.");
    }
    order.line_items.push_back(domain::LineItem{
        item.item_ref, entry->name, item.quantity, entry->unit_price});
    order.total_amount += entry->unit_price * item.quantity;
  }

  return order;
}

// -----------------------------------------------------------------------------
// place(): key, id, insert, notify
// -----------------------------------------------------------------------------
OrderView OrderService::place(domain::Order order) {
  order.creation_key = sequencer_.next();
  order.id = id_gen_.next_id();
  order.status = domain::OrderStatus::Pending;
  order.created_at = ms_to_timestamp(clock_.now_ms());
  order.updated_at = order.created_at;

  domain::Order stored = repository_.insert(std::move(order));

  notify_loop_.push(OrderCreatedEvent{stored});

  std::cout << "[OrderService] order_id=" << stored.id
            << " created. key=" << stored.creation_key
            << " items=" << stored.line_items.size()
            << " total=" << stored.total_amount << "\n";

  auto position = positionOf(stored);
  return OrderView{std::move(stored), position};
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
OrderView OrderService::getOrder(domain::OrderId id) const {
  auto order = repository_.get(id);
  if (!order) {
    throw NotFound("Order " + std::to_string(id) + " not found.");
  }
  auto position = positionOf(*order);
  return OrderView{std::move(*order), position};
}

std::vector<domain::Order> OrderService::listActive() const {
  return repository_.listActive();
}

std::vector<domain::Order> OrderService::listHistory(
    HistoryFilter filter) const {
  filter.limit = std::min(filter.limit, options_.history_limit);
  return repository_.listHistory(filter);
}

std::vector<OrderView> OrderService::listByOwner(
    const std::string& owner_ref,
    std::optional<domain::OrderStatus> status) const {
  auto orders =
      repository_.listByOwner(owner_ref, status, options_.owner_history_limit);
  const auto active = repository_.listActive();

  std::vector<OrderView> views;
  views.reserve(orders.size());
  for (auto& order : orders) {
    auto position = QueuePositionCalculator::rank(order, active);
    views.push_back(OrderView{std::move(order), position});
  }
  return views;
}

domain::Order OrderService::transition(domain::OrderId id,
                                       domain::OrderStatus requested) {
  return state_machine_->transition(id, requested);
}

std::optional<std::size_t> OrderService::positionOf(
    const domain::Order& order) const {
  if (!domain::isActive(order.status)) {
    return std::nullopt;
  }
  return QueuePositionCalculator::rank(order, repository_.listActive());
}

}  // namespace qless
