#pragma once

#include <string>
#include <vector>

namespace qless {

// One cart line: a menu reference and how many.
struct CartLine {
  std::string item_ref;
  int quantity{0};
};

// -----------------------------------------------------------------------------
// ICartStore — a registered customer's accumulated cart
// -----------------------------------------------------------------------------
//
// @brief  Used only by "create order from cart".
//
// @details
// take() empties the cart and hands its lines to exactly one caller, so two
// concurrent placements for one owner cannot both order the same lines.
// When the order built from taken lines is rejected (unavailable item,
// unknown item), OrderService passes them to restore(), which merges them
// back in front of anything added to the cart in the meantime.
//
// Thread model: all methods safe to call concurrently.
// -----------------------------------------------------------------------------
class ICartStore {
 public:
  virtual ~ICartStore() = default;

  // Removes and returns the owner's lines. Empty when there is no cart.
  virtual std::vector<CartLine> take(const std::string& owner_ref) = 0;

  virtual void restore(const std::string& owner_ref,
                       const std::vector<CartLine>& lines) = 0;
};

}  // namespace qless
