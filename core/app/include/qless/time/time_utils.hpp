#pragma once

#include "qless/domain/order.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace qless {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridges ITimeProvider's int64 milliseconds, the domain Timestamp
//         (system_clock::time_point) and the string forms used on the wire.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

inline domain::Timestamp ms_to_timestamp(std::int64_t ms) {
  return domain::Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(domain::Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// formatIso8601(tp)
// -------------------------------------------------------------------------
// @brief  UTC, millisecond precision: "2025-01-15T09:30:00.125Z".
// -------------------------------------------------------------------------
std::string formatIso8601(domain::Timestamp tp);

// -------------------------------------------------------------------------
// parseDay(day)
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD" to UTC midnight of that day.
//
// @return std::nullopt if the string is not a valid calendar date in that
//         exact format.
// -------------------------------------------------------------------------
std::optional<domain::Timestamp> parseDay(const std::string& day);

}  // namespace qless
