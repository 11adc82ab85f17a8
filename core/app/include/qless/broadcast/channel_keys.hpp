#pragma once

#include "qless/domain/order.hpp"

#include <string>

namespace qless {

// -----------------------------------------------------------------------------
// Channel keys and event names
// -----------------------------------------------------------------------------
// Every observer can subscribe to "global". A customer's device subscribes to
// its own "order:{id}". The kitchen display subscribes to "kitchen".
//
// Over ZeroMQ the key is the first frame and SUB filtering is by prefix, so
// "order:4" also matches "order:42". Subscribers to a per-order channel must
// compare the received key exactly.
// -----------------------------------------------------------------------------
inline constexpr const char* kGlobalChannel = "global";
inline constexpr const char* kKitchenChannel = "kitchen";

inline std::string orderChannel(domain::OrderId id) {
  return "order:" + std::to_string(id);
}

inline constexpr const char* kQueueUpdateEvent = "queue:update";
inline constexpr const char* kQueuePositionEvent = "queue:position";
inline constexpr const char* kKitchenQueueEvent = "kitchen:queue";
inline constexpr const char* kOrderReadyEvent = "order:ready";

}  // namespace qless
