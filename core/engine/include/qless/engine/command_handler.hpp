#pragma once

#include "qless/engine/order_service.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace qless {

// -----------------------------------------------------------------------------
// CommandHandler — JSON request/response front end of OrderService
// -----------------------------------------------------------------------------
//
// @brief  Turns one request string from the REP socket into one response
//         string.
//
// @details
// A request is either the bare string "PING" or a JSON object whose
// "command" field selects the operation:
//
//   PING                    → {"status":"ok","response":"PONG"}
//   create_order            displayName, items[{itemRef,quantity}], ownerRef?
//   create_order_from_cart  ownerRef, displayName
//   get_order               orderId
//   list_active             (none)
//   list_history            status?, day? ("YYYY-MM-DD"), limit?
//   list_my_orders          ownerRef, status?
//   update_status           orderId, status
//
// orderId is accepted as a string ("42") or a number. Responses carry
// {"status":"ok", …} on success and
// {"status":"error","error":"<Name>","message":"…"} on failure, where Name
// is OrderError::name(). InvalidTransition responses also carry "current"
// and "allowed". Malformed JSON, a missing or mistyped field, an unknown
// status or an unknown command is InvalidRequest.
//
// handle() never throws for request-level failures.
//
// Thread model:
//   Called on the RealtimeServer thread. Every OrderService operation it
//   calls is thread-safe.
// -----------------------------------------------------------------------------
class CommandHandler {
 public:
  explicit CommandHandler(OrderService& service) : service_(service) {}

  std::string handle(const std::string& request);

 private:
  nlohmann::json dispatch(const nlohmann::json& request);

  nlohmann::json createOrder(const nlohmann::json& request);
  nlohmann::json createOrderFromCart(const nlohmann::json& request);
  nlohmann::json getOrder(const nlohmann::json& request);
  nlohmann::json listActive();
  nlohmann::json listHistory(const nlohmann::json& request);
  nlohmann::json listMyOrders(const nlohmann::json& request);
  nlohmann::json updateStatus(const nlohmann::json& request);

  static nlohmann::json viewToJson(const OrderView& view);
  static nlohmann::json errorResponse(const char* name,
                                      const std::string& message);

  OrderService& service_;
};

}  // namespace qless
