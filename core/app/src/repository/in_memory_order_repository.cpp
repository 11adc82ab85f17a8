#include "qless/repository/in_memory_order_repository.hpp"
#include "qless/errors/order_errors.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>

namespace qless {

// -----------------------------------------------------------------------------
// insert(): exclusive lock, reject duplicate ids
// -----------------------------------------------------------------------------
domain::Order InMemoryOrderRepository::insert(domain::Order order) {
  std::unique_lock lock(mutex_);
  auto [it, inserted] = orders_.emplace(order.id, order);
  if (!inserted) {
    throw std::logic_error("Order id " + std::to_string(order.id) +
                           " already stored.");
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// get(): shared lock point lookup
// -----------------------------------------------------------------------------
std::optional<domain::Order> InMemoryOrderRepository::get(
    domain::OrderId id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// listActive(): one shared-lock scan, ascending creation_key
// -----------------------------------------------------------------------------
std::vector<domain::Order> InMemoryOrderRepository::listActive() const {
  std::vector<domain::Order> active;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (domain::isActive(order.status)) {
        active.push_back(order);
      }
    }
  }

  std::sort(active.begin(), active.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.creation_key < b.creation_key;
            });
  return active;
}

// -----------------------------------------------------------------------------
// listByOwner()
// -----------------------------------------------------------------------------
std::vector<domain::Order> InMemoryOrderRepository::listByOwner(
    const std::string& owner_ref, std::optional<domain::OrderStatus> status,
    std::size_t limit) const {
  std::vector<domain::Order> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (!order.owner_ref || *order.owner_ref != owner_ref) {
        continue;
      }
      if (status && order.status != *status) {
        continue;
      }
      result.push_back(order);
    }
  }
  newestFirst(result, limit);
  return result;
}

// -----------------------------------------------------------------------------
// listHistory()
// -----------------------------------------------------------------------------
std::vector<domain::Order> InMemoryOrderRepository::listHistory(
    const HistoryFilter& filter) const {
  std::vector<domain::Order> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (filter.status && order.status != *filter.status) {
        continue;
      }
      if (filter.day_start) {
        const auto day_end = *filter.day_start + std::chrono::hours(24);
        if (order.created_at < *filter.day_start ||
            order.created_at >= day_end) {
          continue;
        }
      }
      result.push_back(order);
    }
  }
  newestFirst(result, filter.limit);
  return result;
}

// -----------------------------------------------------------------------------
// updateStatus(): compare and write under one exclusive lock
// -----------------------------------------------------------------------------
domain::Order InMemoryOrderRepository::updateStatus(
    domain::OrderId id, domain::OrderStatus expected, domain::OrderStatus next,
    domain::Timestamp updated_at) {
  std::unique_lock lock(mutex_);

  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw NotFound("Order " + std::to_string(id) + " not found.");
  }

  domain::Order& order = it->second;
  if (order.status != expected) {
    throw ConflictError(id, expected, order.status);
  }

  order.status = next;
  order.updated_at = updated_at;
  return order;
}

std::size_t InMemoryOrderRepository::size() const {
  std::shared_lock lock(mutex_);
  return orders_.size();
}

void InMemoryOrderRepository::newestFirst(std::vector<domain::Order>& orders,
                                          std::size_t limit) {
  std::sort(orders.begin(), orders.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.creation_key > b.creation_key;
            });
  if (orders.size() > limit) {
    orders.resize(limit);
  }
}

}  // namespace qless
