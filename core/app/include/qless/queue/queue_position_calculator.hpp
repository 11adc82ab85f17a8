#pragma once

#include "qless/domain/order.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace qless {

// -----------------------------------------------------------------------------
// QueueEntry
// -----------------------------------------------------------------------------
// One active order with its derived 1-based rank. Built fresh for every
// snapshot; never stored.
// -----------------------------------------------------------------------------
struct QueueEntry {
  domain::Order order;
  std::size_t position{0};
};

// -----------------------------------------------------------------------------
// QueuePositionCalculator — derives queue ranks from the active set
// -----------------------------------------------------------------------------
//
// @brief  Ranks active orders by creation_key, 1 = next to be served.
//
// @details
// Position is derived on every query, never cached. However many orders
// complete or arrive between two queries, the answer is recomputed from the
// current active set, so there is no counter to go stale.
//
// rank(order, active) = 1 + |{ o in active : o.creation_key < order.creation_key }|
//
// CreationKeys never tie, so ranks within one active set are exactly 1..n.
//
// Orders that are Ready or Completed have no rank. rank() returns
// std::nullopt for them rather than 0 or a stale value; callers report
// "no position".
//
// Thread model: stateless, pure functions of their arguments.
// -----------------------------------------------------------------------------
class QueuePositionCalculator {
 public:
  // -------------------------------------------------------------------------
  // rank(order, active)
  // -------------------------------------------------------------------------
  // @param  order   The order to rank. Its own status decides activity; it
  //                 does not need to be an element of active.
  // @param  active  Current active set, any order.
  //
  // @return 1-based position, or std::nullopt if order is not active.
  // -------------------------------------------------------------------------
  static std::optional<std::size_t> rank(
      const domain::Order& order, const std::vector<domain::Order>& active);

  // -------------------------------------------------------------------------
  // rankAll(active)
  // -------------------------------------------------------------------------
  // @param  active  Active orders, any order. Inactive entries are skipped.
  // @return Entries sorted by ascending creation_key with positions 1..n.
  // -------------------------------------------------------------------------
  static std::vector<QueueEntry> rankAll(std::vector<domain::Order> active);
};

}  // namespace qless
