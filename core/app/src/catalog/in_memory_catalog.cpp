#include "qless/catalog/in_memory_catalog.hpp"

#include <mutex>
#include <utility>

namespace qless {

std::optional<CatalogItem> InMemoryCatalog::lookup(
    const std::string& item_ref) const {
  std::shared_lock lock(mutex_);
  auto it = items_.find(item_ref);
  if (it == items_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryCatalog::upsert(const std::string& item_ref, CatalogItem item) {
  std::unique_lock lock(mutex_);
  items_[item_ref] = std::move(item);
}

bool InMemoryCatalog::setPrice(const std::string& item_ref,
                               double unit_price) {
  std::unique_lock lock(mutex_);
  auto it = items_.find(item_ref);
  if (it == items_.end()) {
    return false;
  }
  it->second.unit_price = unit_price;
  return true;
}

bool InMemoryCatalog::setAvailable(const std::string& item_ref,
                                   bool available) {
  std::unique_lock lock(mutex_);
  auto it = items_.find(item_ref);
  if (it == items_.end()) {
    return false;
  }
  it->second.is_available = available;
  return true;
}

bool InMemoryCatalog::remove(const std::string& item_ref) {
  std::unique_lock lock(mutex_);
  return items_.erase(item_ref) > 0;
}

}  // namespace qless
