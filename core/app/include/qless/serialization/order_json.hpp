#pragma once

#include "qless/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>

namespace qless {

// -----------------------------------------------------------------------------
// Order → JSON
// -----------------------------------------------------------------------------
//
// @brief  The one JSON shape of an order, shared by command responses.
//
// @details
// Ids go out as strings ("42") so clients treat them as opaque. Timestamps
// are ISO-8601 UTC. Owner is null for guest orders.
//
//   {"id":"42","ownerRef":null,"displayName":"Ana",
//    "items":[{"catalogRef":"m1","name":"Burger","quantity":2,"unitPrice":50}],
//    "totalAmount":100,"status":"pending",
//    "creationKey":{"timestampMs":…,"sequence":0},
//    "createdAt":"…","updatedAt":"…"}
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Order& order);

// Wire form of a position: the number, or null when the order has none.
nlohmann::json positionToJson(const std::optional<std::size_t>& position);

// String form used for ids in every payload.
std::string idToString(domain::OrderId id);

}  // namespace qless
