#pragma once

#include "qless/domain/order.hpp"

#include <atomic>
#include <cstdint>

namespace qless {

// -----------------------------------------------------------------------------
// OrderIdGenerator — thread-safe source of order identifiers
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique OrderId values from an atomic counter.
//
// @details
// Ids start at 1 (0 is the "unset" sentinel) and only need to be unique.
// They are NOT the queue ordering key: two request threads may draw ids in
// one order and sequencer keys in the other. Queue position comes from the
// Sequencer alone.
//
// The counter can be seeded so a restarted process backed by a persistent
// repository continues past the highest id already stored.
//
// Thread model:
//   next_id() is safe to call concurrently from any number of threads.
//
// Ownership:
//   Owned as a value member by OrderService; injected nowhere else.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;
  explicit OrderIdGenerator(domain::OrderId first) : next_id_(first) {}

  // Copying would create two sources issuing duplicate ids.
  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns the next unused id.
  //
  // Relaxed ordering: uniqueness is the only requirement, no other memory
  // operation is ordered against this increment.
  // -------------------------------------------------------------------------
  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace qless
