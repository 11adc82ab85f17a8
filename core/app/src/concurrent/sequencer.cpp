#include "qless/concurrent/sequencer.hpp"

#include <limits>

namespace qless {

Sequencer::Sequencer(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// next(): clamp to the last timestamp, tie-break with the counter
// -----------------------------------------------------------------------------
domain::CreationKey Sequencer::next() {
  std::lock_guard lock(mutex_);

  const std::int64_t now = clock_.now_ms();

  if (!issued_any_ || now > last_.timestamp_ms) {
    last_.timestamp_ms = now;
    last_.sequence = 0;
    issued_any_ = true;
    return last_;
  }

  if (last_.sequence == std::numeric_limits<std::uint32_t>::max()) {
    last_.timestamp_ms += 1;
    last_.sequence = 0;
    return last_;
  }

  ++last_.sequence;
  return last_;
}

}  // namespace qless
