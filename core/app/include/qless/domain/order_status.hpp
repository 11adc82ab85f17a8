#pragma once

#include <optional>
#include <string>

namespace qless {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order preparation pipeline
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an order can occupy between placement at
//         the counter and hand-over to the customer.
//
// @details
// The lifecycle is a straight line. Each state has exactly one successor and
// the OrderStateMachine refuses everything else:
//
//   Pending ───> Preparing ───> Ready ───> Completed
//
// Pending and Preparing are the "active" states: an order in either of them
// occupies a slot in the service queue and has a queue position. Ready and
// Completed orders have left the queue; they no longer have a position.
//
// Terminal state: Completed. Nothing leaves it.
//
// Thread model:
//   Plain enum, value type. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,    // Placed, waiting for the kitchen to pick it up
  Preparing,  // Kitchen is working on it
  Ready,      // Waiting at the counter for pickup
  Completed,  // Handed over; terminal
};

// -------------------------------------------------------------------------
// isActive(status)
// -------------------------------------------------------------------------
// @brief  True for the two states that occupy a queue position.
// -------------------------------------------------------------------------
inline bool isActive(OrderStatus status) {
  return status == OrderStatus::Pending || status == OrderStatus::Preparing;
}

// -------------------------------------------------------------------------
// toString / parseOrderStatus
// -------------------------------------------------------------------------
// @brief  Wire names are lowercase ("pending", "preparing", "ready",
//         "completed"). parseOrderStatus() returns std::nullopt for anything
//         else; callers decide whether that is a request error.
// -------------------------------------------------------------------------
const char* toString(OrderStatus status);
std::optional<OrderStatus> parseOrderStatus(const std::string& name);

}  // namespace domain
}  // namespace qless
