#pragma once

#include "qless/catalog/i_catalog.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace qless {

// -----------------------------------------------------------------------------
// InMemoryCatalog — process-local ICatalog
// -----------------------------------------------------------------------------
// Seeded from the "menu" section of the service configuration. The mutators
// stand in for the menu admin: repricing or switching off an entry affects
// future orders only.
// -----------------------------------------------------------------------------
class InMemoryCatalog final : public ICatalog {
 public:
  std::optional<CatalogItem> lookup(const std::string& item_ref) const override;

  // Inserts or replaces the entry.
  void upsert(const std::string& item_ref, CatalogItem item);

  // @return false if item_ref is unknown.
  bool setPrice(const std::string& item_ref, double unit_price);
  bool setAvailable(const std::string& item_ref, bool available);
  bool remove(const std::string& item_ref);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, CatalogItem> items_;
};

}  // namespace qless
