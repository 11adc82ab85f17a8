#include "qless/queue/queue_position_calculator.hpp"

#include <algorithm>

namespace qless {

// -----------------------------------------------------------------------------
// rank(): count active orders with a smaller key
// -----------------------------------------------------------------------------
std::optional<std::size_t> QueuePositionCalculator::rank(
    const domain::Order& order, const std::vector<domain::Order>& active) {
  if (!domain::isActive(order.status)) {
    return std::nullopt;
  }

  const auto ahead = std::count_if(
      active.begin(), active.end(), [&order](const domain::Order& other) {
        return domain::isActive(other.status) &&
               other.creation_key < order.creation_key;
      });
  return static_cast<std::size_t>(ahead) + 1;
}

// -----------------------------------------------------------------------------
// rankAll(): sort once, number sequentially
// -----------------------------------------------------------------------------
std::vector<QueueEntry> QueuePositionCalculator::rankAll(
    std::vector<domain::Order> active) {
  active.erase(std::remove_if(active.begin(), active.end(),
                              [](const domain::Order& o) {
                                return !domain::isActive(o.status);
                              }),
               active.end());

  std::sort(active.begin(), active.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.creation_key < b.creation_key;
            });

  std::vector<QueueEntry> entries;
  entries.reserve(active.size());
  std::size_t position = 1;
  for (auto& order : active) {
    entries.push_back(QueueEntry{std::move(order), position++});
  }
  return entries;
}

}  // namespace qless
