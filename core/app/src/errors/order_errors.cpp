#include "qless/errors/order_errors.hpp"

#include <sstream>
#include <utility>

namespace qless {

namespace {

std::string conflictMessage(domain::OrderId id, domain::OrderStatus expected,
                            domain::OrderStatus actual) {
  std::ostringstream os;
  os << "Order " << id << " status changed concurrently: expected \""
     << domain::toString(expected) << "\", found \""
     << domain::toString(actual) << "\".";
  return os.str();
}

// Mirrors the wording the kitchen panel shows:
//   Cannot transition from "ready" to "preparing". Allowed next status: completed
std::string transitionMessage(domain::OrderStatus current,
                              domain::OrderStatus requested,
                              const std::vector<domain::OrderStatus>& allowed) {
  std::ostringstream os;
  os << "Cannot transition from \"" << domain::toString(current) << "\" to \""
     << domain::toString(requested) << "\". Allowed next status: ";
  if (allowed.empty()) {
    os << "none (order is completed)";
  }
  for (std::size_t i = 0; i < allowed.size(); ++i) {
    if (i > 0) {
      os << ", ";
    }
    os << domain::toString(allowed[i]);
  }
  return os.str();
}

}  // namespace

ConflictError::ConflictError(domain::OrderId id, domain::OrderStatus expected,
                             domain::OrderStatus actual)
    : OrderError(conflictMessage(id, expected, actual)),
      id_(id),
      expected_(expected),
      actual_(actual) {}

InvalidTransition::InvalidTransition(domain::OrderStatus current,
                                     domain::OrderStatus requested,
                                     std::vector<domain::OrderStatus> allowed)
    : OrderError(transitionMessage(current, requested, allowed)),
      current_(current),
      requested_(requested),
      allowed_(std::move(allowed)) {}

}  // namespace qless
