#pragma once

#include "qless/domain/creation_key.hpp"
#include "qless/domain/order_status.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qless {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Opaque identifier handed to the customer's device and used as the routing
// key of the order's own channel ("order:{id}"). Assigned by the
// OrderIdGenerator at creation; 0 is never issued and means "unset".
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

// Wall-clock time used for the informational created_at / updated_at fields.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// LineItem
// -----------------------------------------------------------------------------
// Responsibility: One line of an order, copied from the catalog when the
// order is placed.
//
// name and unit_price are a snapshot. If the menu entry is later repriced,
// renamed or deleted, the line keeps what the customer was charged.
// -----------------------------------------------------------------------------
struct LineItem {
  std::string catalog_ref;  // Menu entry this line was built from
  std::string name;         // Menu name at order time
  int quantity{0};          // >= 1
  double unit_price{0.0};   // Menu price at order time
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The full record of one customer order.
//
// @details
// Everything except status and updated_at is fixed at creation. status is
// written only through IOrderRepository::updateStatus(), which the
// OrderStateMachine calls after validating the transition.
//
// total_amount is the sum of quantity * unit_price over line_items, computed
// once by OrderService when the order is built and stored as-is. Nothing
// recomputes it from the live catalog.
//
// Value semantics: repositories hand out copies. A copy is a snapshot of the
// record at the moment it was read; mutating it changes nothing stored.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};                           // Unique, immutable
  std::optional<std::string> owner_ref;   // Registered customer; empty for guests
  std::string display_name;               // Name called out at the counter
  std::vector<LineItem> line_items;       // Price snapshot, immutable
  double total_amount{0.0};               // Computed once at creation
  OrderStatus status{OrderStatus::Pending};
  CreationKey creation_key{};             // Queue ordering key
  Timestamp created_at{};                 // Informational only
  Timestamp updated_at{};                 // Informational only
};

}  // namespace domain
}  // namespace qless
