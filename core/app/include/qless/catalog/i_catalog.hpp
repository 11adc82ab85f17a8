#pragma once

#include <optional>
#include <string>

namespace qless {

// -----------------------------------------------------------------------------
// CatalogItem
// -----------------------------------------------------------------------------
// What the order service needs to know about one menu entry at the moment an
// order is placed. Copied into the order's LineItem; never referenced again.
// -----------------------------------------------------------------------------
struct CatalogItem {
  std::string name;
  double unit_price{0.0};
  bool is_available{true};
};

// -----------------------------------------------------------------------------
// ICatalog — read-only view of the menu
// -----------------------------------------------------------------------------
//
// @brief  Consulted only while building a new order's line-item snapshot.
//
// @details
// Menu management (categories, descriptions, images, the admin that edits
// them) lives outside the core. The core only needs name, price and the
// availability switch.
//
// Thread model: lookup() must be safe to call concurrently.
// -----------------------------------------------------------------------------
class ICatalog {
 public:
  virtual ~ICatalog() = default;

  // std::nullopt when no entry has this reference.
  virtual std::optional<CatalogItem> lookup(
      const std::string& item_ref) const = 0;
};

}  // namespace qless
