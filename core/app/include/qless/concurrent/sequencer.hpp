#pragma once

#include "qless/domain/creation_key.hpp"
#include "qless/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>

namespace qless {

// -----------------------------------------------------------------------------
// Sequencer — issues the queue ordering key of every new order
// -----------------------------------------------------------------------------
//
// @brief  Produces strictly increasing CreationKey values, one per order
//         creation, in true call order across all request threads.
//
// @details
// A key is (timestamp_ms, sequence). Under a mutex, next():
//
//   1. Reads the clock.
//   2. If the reading is later than the last issued timestamp, adopts it and
//      restarts sequence at 0.
//   3. Otherwise (same millisecond, or the clock stepped backwards) keeps the
//      last issued timestamp and increments sequence.
//
// Because step 3 never adopts an earlier reading, keys are strictly
// increasing even across wall-clock adjustments. Because the whole read-
// compare-issue happens under one lock, the caller that acquires the lock
// first always gets the smaller key. No two calls ever produce equal keys.
//
// If sequence would wrap (more than 2^32 orders in one millisecond), the
// timestamp half is bumped by one and sequence restarts; ordering still
// holds.
//
// Thread model:
//   next() is safe to call concurrently from any thread. It never performs
//   I/O; the critical section is a clock read and two integer updates.
//
// Ownership:
//   Owned by OrderService as a value member. Holds a const reference to the
//   time provider, which must outlive it.
// -----------------------------------------------------------------------------
class Sequencer {
 public:
  explicit Sequencer(const ITimeProvider& clock);

  Sequencer(const Sequencer&) = delete;
  Sequencer& operator=(const Sequencer&) = delete;
  Sequencer(Sequencer&&) = delete;
  Sequencer& operator=(Sequencer&&) = delete;

  // -------------------------------------------------------------------------
  // next()
  // -------------------------------------------------------------------------
  // @brief  Issues the next key. Call exactly once per order creation.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  Advances the internal (timestamp, sequence) state.
  // -------------------------------------------------------------------------
  domain::CreationKey next();

 private:
  const ITimeProvider& clock_;

  std::mutex mutex_;
  bool issued_any_{false};
  domain::CreationKey last_{};
};

}  // namespace qless
