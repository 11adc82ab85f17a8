#include "qless/serialization/order_json.hpp"
#include "qless/time/time_utils.hpp"

#include <string>

namespace qless {

std::string idToString(domain::OrderId id) { return std::to_string(id); }

nlohmann::json positionToJson(const std::optional<std::size_t>& position) {
  if (!position) {
    return nullptr;
  }
  return *position;
}

// -----------------------------------------------------------------------------
// toJson(order)
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Order& order) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& line : order.line_items) {
    nlohmann::json j;
    j["catalogRef"] = line.catalog_ref;
    j["name"] = line.name;
    j["quantity"] = line.quantity;
    j["unitPrice"] = line.unit_price;
    items.push_back(std::move(j));
  }

  nlohmann::json j;
  j["id"] = idToString(order.id);
  j["ownerRef"] = order.owner_ref ? nlohmann::json(*order.owner_ref)
                                  : nlohmann::json(nullptr);
  j["displayName"] = order.display_name;
  j["items"] = std::move(items);
  j["totalAmount"] = order.total_amount;
  j["status"] = domain::toString(order.status);
  j["creationKey"] = {{"timestampMs", order.creation_key.timestamp_ms},
                      {"sequence", order.creation_key.sequence}};
  j["createdAt"] = formatIso8601(order.created_at);
  j["updatedAt"] = formatIso8601(order.updated_at);
  return j;
}

}  // namespace qless
