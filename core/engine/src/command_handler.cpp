#include "qless/engine/command_handler.hpp"
#include "qless/errors/order_errors.hpp"
#include "qless/queue/queue_position_calculator.hpp"
#include "qless/serialization/order_json.hpp"
#include "qless/time/time_utils.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <utility>

namespace qless {

namespace {

std::string requireString(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    throw InvalidRequest(std::string("\"") + key + "\" must be a string.");
  }
  return it->get<std::string>();
}

// Whole number that fits an int. Fractions and out-of-range values are
// refused rather than narrowed; the lower bound of 1 is OrderService's check.
int requireQuantity(const nlohmann::json& item) {
  auto it = item.find("quantity");
  if (it != item.end()) {
    if (it->is_number_unsigned()) {
      const auto value = it->get<std::uint64_t>();
      if (value <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        return static_cast<int>(value);
      }
    } else if (it->is_number_integer()) {
      const auto value = it->get<std::int64_t>();
      if (value >= std::numeric_limits<int>::min() &&
          value <= std::numeric_limits<int>::max()) {
        return static_cast<int>(value);
      }
    }
  }
  throw InvalidRequest("\"quantity\" must be a whole number.");
}

domain::OrderId requireOrderId(const nlohmann::json& j) {
  auto it = j.find("orderId");
  if (it != j.end()) {
    if (it->is_number_unsigned()) {
      return it->get<domain::OrderId>();
    }
    if (it->is_string()) {
      const std::string text = it->get<std::string>();
      std::size_t consumed = 0;
      try {
        const auto id = std::stoull(text, &consumed);
        if (consumed == text.size() && !text.empty() && text[0] != '-') {
          return id;
        }
      } catch (const std::logic_error&) {
        // Falls through to the InvalidRequest below.
      }
    }
  }
  throw InvalidRequest("\"orderId\" must be a non-negative integer id.");
}

domain::OrderStatus parseStatus(const std::string& name) {
  auto status = domain::parseOrderStatus(name);
  if (!status) {
    throw InvalidRequest("Unknown status \"" + name + "\".");
  }
  return *status;
}

std::optional<domain::OrderStatus> optionalStatus(const nlohmann::json& j) {
  auto it = j.find("status");
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw InvalidRequest("\"status\" must be a string.");
  }
  return parseStatus(it->get<std::string>());
}

nlohmann::json ok() {
  nlohmann::json j;
  j["status"] = "ok";
  return j;
}

nlohmann::json ordersToJson(const std::vector<domain::Order>& orders) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& order : orders) {
    arr.push_back(toJson(order));
  }
  return arr;
}

}  // namespace

// -----------------------------------------------------------------------------
// handle(): parse, dispatch, map failures to error responses
// -----------------------------------------------------------------------------
std::string CommandHandler::handle(const std::string& request) {
  if (request == "PING") {
    nlohmann::json response = ok();
    response["response"] = "PONG";
    return response.dump();
  }

  try {
    const nlohmann::json parsed = nlohmann::json::parse(request);
    return dispatch(parsed).dump();
  } catch (const InvalidTransition& e) {
    nlohmann::json response = errorResponse(e.name(), e.what());
    response["current"] = domain::toString(e.current());
    nlohmann::json allowed = nlohmann::json::array();
    for (auto s : e.allowed()) {
      allowed.push_back(domain::toString(s));
    }
    response["allowed"] = std::move(allowed);
    return response.dump();
  } catch (const OrderError& e) {
    return errorResponse(e.name(), e.what()).dump();
  } catch (const nlohmann::json::exception& e) {
    return errorResponse("InvalidRequest", e.what()).dump();
  }
}

// -----------------------------------------------------------------------------
// dispatch(): command name → operation
// -----------------------------------------------------------------------------
nlohmann::json CommandHandler::dispatch(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw InvalidRequest("Request must be a JSON object.");
  }
  const std::string command = requireString(request, "command");

  if (command == "PING") {
    nlohmann::json response = ok();
    response["response"] = "PONG";
    return response;
  }
  if (command == "create_order") return createOrder(request);
  if (command == "create_order_from_cart") return createOrderFromCart(request);
  if (command == "get_order") return getOrder(request);
  if (command == "list_active") return listActive();
  if (command == "list_history") return listHistory(request);
  if (command == "list_my_orders") return listMyOrders(request);
  if (command == "update_status") return updateStatus(request);

  throw InvalidRequest("Unknown command: " + command);
}

nlohmann::json CommandHandler::createOrder(const nlohmann::json& request) {
  const std::string display_name = requireString(request, "displayName");

  auto items_it = request.find("items");
  if (items_it == request.end() || !items_it->is_array()) {
    throw InvalidRequest("\"items\" must be an array.");
  }
  std::vector<OrderItemRequest> items;
  for (const auto& item : *items_it) {
    if (!item.is_object()) {
      throw InvalidRequest("Each item must be an object.");
    }
    items.push_back(OrderItemRequest{requireString(item, "itemRef"),
                                     requireQuantity(item)});
  }

  std::optional<std::string> owner_ref;
  auto owner_it = request.find("ownerRef");
  if (owner_it != request.end() && !owner_it->is_null()) {
    owner_ref = owner_it->get<std::string>();
  }

  return viewToJson(
      service_.createOrder(display_name, items, std::move(owner_ref)));
}

nlohmann::json CommandHandler::createOrderFromCart(
    const nlohmann::json& request) {
  return viewToJson(service_.createOrderFromCart(
      requireString(request, "ownerRef"),
      requireString(request, "displayName")));
}

nlohmann::json CommandHandler::getOrder(const nlohmann::json& request) {
  return viewToJson(service_.getOrder(requireOrderId(request)));
}

// -----------------------------------------------------------------------------
// listActive(): same board the kitchen channel shows
// -----------------------------------------------------------------------------
nlohmann::json CommandHandler::listActive() {
  const auto entries = QueuePositionCalculator::rankAll(service_.listActive());

  nlohmann::json orders = nlohmann::json::array();
  for (const auto& entry : entries) {
    nlohmann::json j = toJson(entry.order);
    j["queuePosition"] = entry.position;
    orders.push_back(std::move(j));
  }

  nlohmann::json response = ok();
  response["orders"] = std::move(orders);
  return response;
}

nlohmann::json CommandHandler::listHistory(const nlohmann::json& request) {
  HistoryFilter filter;
  filter.status = optionalStatus(request);

  auto day_it = request.find("day");
  if (day_it != request.end() && !day_it->is_null()) {
    const std::string day = day_it->get<std::string>();
    filter.day_start = parseDay(day);
    if (!filter.day_start) {
      throw InvalidRequest("\"day\" must be YYYY-MM-DD, got \"" + day + "\".");
    }
  }

  auto limit_it = request.find("limit");
  if (limit_it != request.end() && !limit_it->is_null()) {
    filter.limit = limit_it->get<std::size_t>();
  }

  nlohmann::json response = ok();
  response["orders"] = ordersToJson(service_.listHistory(filter));
  return response;
}

nlohmann::json CommandHandler::listMyOrders(const nlohmann::json& request) {
  const auto views = service_.listByOwner(requireString(request, "ownerRef"),
                                          optionalStatus(request));

  nlohmann::json orders = nlohmann::json::array();
  for (const auto& view : views) {
    nlohmann::json j = toJson(view.order);
    j["queuePosition"] = positionToJson(view.queue_position);
    orders.push_back(std::move(j));
  }

  nlohmann::json response = ok();
  response["orders"] = std::move(orders);
  return response;
}

nlohmann::json CommandHandler::updateStatus(const nlohmann::json& request) {
  const domain::OrderId id = requireOrderId(request);
  const domain::OrderStatus requested =
      parseStatus(requireString(request, "status"));

  const domain::Order updated = service_.transition(id, requested);

  std::cout << "[CommandHandler] order_id=" << id << " -> "
            << domain::toString(updated.status) << "\n";

  nlohmann::json response = ok();
  response["order"] = toJson(updated);
  return response;
}

nlohmann::json CommandHandler::viewToJson(const OrderView& view) {
  nlohmann::json response = ok();
  response["order"] = toJson(view.order);
  response["queuePosition"] = positionToJson(view.queue_position);
  return response;
}

nlohmann::json CommandHandler::errorResponse(const char* name,
                                             const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["error"] = name;
  j["message"] = message;
  return j;
}

}  // namespace qless
