#include "qless/domain/order_status.hpp"

namespace qless {
namespace domain {

// -----------------------------------------------------------------------------
// toString(): lowercase wire names
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:   return "pending";
    case OrderStatus::Preparing: return "preparing";
    case OrderStatus::Ready:     return "ready";
    case OrderStatus::Completed: return "completed";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parseOrderStatus(): inverse of toString(), exact match only
// -----------------------------------------------------------------------------
std::optional<OrderStatus> parseOrderStatus(const std::string& name) {
  if (name == "pending") {
    return OrderStatus::Pending;
  }
  if (name == "preparing") {
    return OrderStatus::Preparing;
  }
  if (name == "ready") {
    return OrderStatus::Ready;
  }
  if (name == "completed") {
    return OrderStatus::Completed;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace qless
