#pragma once

#include "qless/time/i_time_provider.hpp"

namespace qless {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock. Used by the qless binary.
//
// @details
// The system clock can step backwards (NTP adjustment). Components that
// need monotonic behaviour, such as the Sequencer, must not assume it; the
// Sequencer clamps to the last value it saw.
//
// Thread model: stateless, safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace qless
