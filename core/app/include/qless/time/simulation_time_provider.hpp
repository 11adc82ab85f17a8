#pragma once

#include "qless/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace qless {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// Used by tests to make time stand still (many creations in the same tick),
// to step it backwards (Sequencer must still issue increasing keys), or to
// place orders on specific calendar days (history day filter).
//
// Internal storage is a single std::atomic<int64_t>; readers on request
// threads never block the writer.
//
// Thread model:
//   advance_time() and now_ms() are both safe from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock. Not required to move forward.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace qless
