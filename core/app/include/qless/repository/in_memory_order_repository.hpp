#pragma once

#include "qless/repository/i_order_repository.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace qless {

// -----------------------------------------------------------------------------
// InMemoryOrderRepository — process-local IOrderRepository
// -----------------------------------------------------------------------------
//
// @brief  Hash map of orders guarded by a std::shared_mutex.
//
// @details
// Readers (get, list*) take a shared lock, so request threads looking up
// their order do not serialize behind each other. insert and updateStatus
// take the exclusive lock; updateStatus performs its compare and its write
// inside the same exclusive section, which is what makes it an atomic
// compare-and-swap.
//
// Scans are linear. The active set of a walk-up counter is small and the
// history queries are capped.
// -----------------------------------------------------------------------------
class InMemoryOrderRepository final : public IOrderRepository {
 public:
  InMemoryOrderRepository() = default;

  InMemoryOrderRepository(const InMemoryOrderRepository&) = delete;
  InMemoryOrderRepository& operator=(const InMemoryOrderRepository&) = delete;

  domain::Order insert(domain::Order order) override;
  std::optional<domain::Order> get(domain::OrderId id) const override;
  std::vector<domain::Order> listActive() const override;
  std::vector<domain::Order> listByOwner(
      const std::string& owner_ref,
      std::optional<domain::OrderStatus> status,
      std::size_t limit) const override;
  std::vector<domain::Order> listHistory(
      const HistoryFilter& filter) const override;
  domain::Order updateStatus(domain::OrderId id,
                             domain::OrderStatus expected,
                             domain::OrderStatus next,
                             domain::Timestamp updated_at) override;

  std::size_t size() const;

 private:
  // Sorts newest first (descending creation_key) and truncates to limit.
  static void newestFirst(std::vector<domain::Order>& orders,
                          std::size_t limit);

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::OrderId, domain::Order> orders_;
};

}  // namespace qless
