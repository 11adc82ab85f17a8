#include "qless/state/order_state_machine.hpp"
#include "qless/errors/order_errors.hpp"
#include "qless/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

namespace qless {

OrderStateMachine::OrderStateMachine(IOrderRepository& repository,
                                     const ITimeProvider& clock,
                                     EventSink event_sink, int max_retries)
    : repository_(repository),
      clock_(clock),
      event_sink_(std::move(event_sink)),
      max_retries_(std::max(0, max_retries)) {}

// -----------------------------------------------------------------------------
// allowedNext: the transition table
// -----------------------------------------------------------------------------
std::vector<domain::OrderStatus> OrderStateMachine::allowedNext(
    domain::OrderStatus status) {
  using S = domain::OrderStatus;

  switch (status) {
    case S::Pending:   return {S::Preparing};
    case S::Preparing: return {S::Ready};
    case S::Ready:     return {S::Completed};
    case S::Completed: return {};
  }
  return {};
}

bool OrderStateMachine::isLegal(domain::OrderStatus from,
                                domain::OrderStatus to) {
  const auto allowed = allowedNext(from);
  return std::find(allowed.begin(), allowed.end(), to) != allowed.end();
}

// -----------------------------------------------------------------------------
// transition: read, check, compare-and-swap, bounded retry on conflict
// -----------------------------------------------------------------------------
domain::Order OrderStateMachine::transition(domain::OrderId id,
                                            domain::OrderStatus requested) {
  for (int attempt = 0;; ++attempt) {
    auto current = repository_.get(id);
    if (!current) {
      throw NotFound("Order " + std::to_string(id) + " not found.");
    }

    const domain::OrderStatus previous = current->status;
    if (!isLegal(previous, requested)) {
      throw InvalidTransition(previous, requested, allowedNext(previous));
    }

    try {
      domain::Order updated = repository_.updateStatus(
          id, previous, requested, ms_to_timestamp(clock_.now_ms()));
      emit(updated, previous);
      return updated;
    } catch (const ConflictError& e) {
      if (attempt >= max_retries_) {
        throw;
      }
      std::cerr << "[OrderStateMachine] WARNING: " << e.what()
                << " Retrying (" << (attempt + 1) << "/" << max_retries_
                << ").\n";
    }
  }
}

// -----------------------------------------------------------------------------
// emit: the transition is already stored; a failing sink must not undo it
// -----------------------------------------------------------------------------
void OrderStateMachine::emit(const domain::Order& order,
                             domain::OrderStatus previous) {
  if (!event_sink_) {
    return;
  }
  try {
    event_sink_(OrderStatusChangedEvent{order, previous});
  } catch (const std::exception& e) {
    std::cerr << "[OrderStateMachine] WARNING: could not queue status "
                 "notification for order_id="
              << order.id << ": " << e.what() << "\n";
  }
}

}  // namespace qless
