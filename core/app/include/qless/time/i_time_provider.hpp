#pragma once

#include <cstdint>

namespace qless {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// Two components read the clock: the Sequencer (coarse timestamp half of
// every CreationKey) and OrderService (created_at / updated_at). In
// production both read the system clock through LiveTimeProvider. Tests
// inject a SimulationTimeProvider instead, which lets them pin the clock so
// that dozens of orders are created inside one millisecond, exactly the
// situation the Sequencer's tie-break counter exists for.
//
// Units: int64_t milliseconds since the Unix epoch, the resolution of the
// timestamp half of a CreationKey.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from many request
//   threads. Writers (SimulationTimeProvider::advance_time) synchronize
//   internally.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace qless
