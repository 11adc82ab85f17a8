#include "qless/cart/in_memory_cart_store.hpp"

namespace qless {

namespace {

void mergeLine(std::vector<CartLine>& lines, const CartLine& incoming) {
  for (auto& line : lines) {
    if (line.item_ref == incoming.item_ref) {
      line.quantity += incoming.quantity;
      return;
    }
  }
  lines.push_back(incoming);
}

}  // namespace

std::vector<CartLine> InMemoryCartStore::take(const std::string& owner_ref) {
  std::lock_guard lock(mutex_);
  auto it = carts_.find(owner_ref);
  if (it == carts_.end()) {
    return {};
  }
  std::vector<CartLine> taken = std::move(it->second);
  carts_.erase(it);
  return taken;
}

void InMemoryCartStore::restore(const std::string& owner_ref,
                                const std::vector<CartLine>& lines) {
  if (lines.empty()) {
    return;
  }
  std::lock_guard lock(mutex_);
  auto& current = carts_[owner_ref];
  std::vector<CartLine> merged = lines;
  for (const auto& line : current) {
    mergeLine(merged, line);
  }
  current = std::move(merged);
}

void InMemoryCartStore::add(const std::string& owner_ref,
                            const std::string& item_ref, int quantity) {
  std::lock_guard lock(mutex_);
  mergeLine(carts_[owner_ref], CartLine{item_ref, quantity});
}

std::vector<CartLine> InMemoryCartStore::lines(
    const std::string& owner_ref) const {
  std::lock_guard lock(mutex_);
  auto it = carts_.find(owner_ref);
  if (it == carts_.end()) {
    return {};
  }
  return it->second;
}

}  // namespace qless
