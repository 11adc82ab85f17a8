#pragma once

#include "qless/cart/i_cart_store.hpp"

#include <mutex>
#include <unordered_map>

namespace qless {

// -----------------------------------------------------------------------------
// InMemoryCartStore — process-local ICartStore
// -----------------------------------------------------------------------------
// add() merges: adding an item already in the cart increases its quantity
// instead of creating a second line.
// -----------------------------------------------------------------------------
class InMemoryCartStore final : public ICartStore {
 public:
  std::vector<CartLine> take(const std::string& owner_ref) override;
  void restore(const std::string& owner_ref,
               const std::vector<CartLine>& lines) override;

  void add(const std::string& owner_ref, const std::string& item_ref,
           int quantity);

  // Copy of the owner's current lines.
  std::vector<CartLine> lines(const std::string& owner_ref) const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<CartLine>> carts_;
};

}  // namespace qless
