#pragma once

#include "qless/domain/order.hpp"
#include "qless/domain/order_status.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qless {

// -----------------------------------------------------------------------------
// HistoryFilter
// -----------------------------------------------------------------------------
// Staff history query. Both filters optional; day_start, when set, selects
// orders created in [day_start, day_start + 24h).
// -----------------------------------------------------------------------------
struct HistoryFilter {
  std::optional<domain::OrderStatus> status;
  std::optional<domain::Timestamp> day_start;
  std::size_t limit{200};
};

// -----------------------------------------------------------------------------
// IOrderRepository — durable store of Order records
// -----------------------------------------------------------------------------
//
// @brief  The only shared mutable resource in the service. Every read and
//         every write of order state goes through it.
//
// @details
// Storage mechanics are out of scope; the core depends on this contract
// only. Implementations must provide:
//
//   - Atomic compare-and-swap on status (updateStatus). Two transitions
//     racing from the same prior status must not both succeed; the loser
//     gets ConflictError.
//   - listActive() as one consistent read: the QueueBroadcaster builds all
//     three channel payloads of a broadcast cycle from a single call.
//
// Return values are copies. Nothing handed out aliases stored state.
//
// Thread model:
//   Every method is safe to call concurrently from any thread.
//
// Ownership:
//   Owned by the process (main or a test); OrderService and the
//   QueueBroadcaster hold references.
// -----------------------------------------------------------------------------
class IOrderRepository {
 public:
  virtual ~IOrderRepository() = default;

  // -------------------------------------------------------------------------
  // insert(order)
  // -------------------------------------------------------------------------
  // @brief  Stores a fully built order and returns the stored copy.
  // @throws std::logic_error if the id is already present.
  // -------------------------------------------------------------------------
  virtual domain::Order insert(domain::Order order) = 0;

  // Point lookup; std::nullopt when absent.
  virtual std::optional<domain::Order> get(domain::OrderId id) const = 0;

  // -------------------------------------------------------------------------
  // listActive()
  // -------------------------------------------------------------------------
  // @return Every Pending or Preparing order, ascending creation_key.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Order> listActive() const = 0;

  // -------------------------------------------------------------------------
  // listByOwner(owner_ref, status, limit)
  // -------------------------------------------------------------------------
  // @return The owner's orders, optionally restricted to one status, most
  //         recently created first, at most limit entries.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Order> listByOwner(
      const std::string& owner_ref,
      std::optional<domain::OrderStatus> status,
      std::size_t limit) const = 0;

  // -------------------------------------------------------------------------
  // listHistory(filter)
  // -------------------------------------------------------------------------
  // @return Orders matching filter, most recently created first, at most
  //         filter.limit entries.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Order> listHistory(
      const HistoryFilter& filter) const = 0;

  // -------------------------------------------------------------------------
  // updateStatus(id, expected, next, updated_at)
  // -------------------------------------------------------------------------
  // @brief  Sets status to next iff it currently equals expected.
  //
  // @return The order after the update.
  // @throws NotFound       if no order has this id.
  // @throws ConflictError  if the stored status is not expected.
  //
  // Does not judge whether expected → next is a legal transition; that is
  // the OrderStateMachine's job.
  // -------------------------------------------------------------------------
  virtual domain::Order updateStatus(domain::OrderId id,
                                     domain::OrderStatus expected,
                                     domain::OrderStatus next,
                                     domain::Timestamp updated_at) = 0;
};

}  // namespace qless
