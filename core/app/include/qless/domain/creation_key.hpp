#pragma once

#include <cstdint>
#include <ostream>
#include <tuple>

namespace qless {
namespace domain {

// -----------------------------------------------------------------------------
// CreationKey
// -----------------------------------------------------------------------------
// Responsibility: The sole ordering key of the service queue. Issued exactly
// once per order by the Sequencer.
//
// A millisecond timestamp alone ties when two orders land in the same tick,
// so the key carries a tie-break counter. Keys compare lexicographically on
// (timestamp_ms, sequence); the Sequencer guarantees that no two keys it
// issues ever compare equal and that a later call never gets a smaller key.
//
// timestamp_ms is the clock reading the Sequencer saw (or the last one it
// saw, if the clock stalled). It is an ordering input, not the human-facing
// creation time; that is Order::created_at.
// -----------------------------------------------------------------------------
struct CreationKey {
  std::int64_t timestamp_ms{0};
  std::uint32_t sequence{0};
};

inline bool operator<(const CreationKey& a, const CreationKey& b) {
  return std::tie(a.timestamp_ms, a.sequence) <
         std::tie(b.timestamp_ms, b.sequence);
}

inline bool operator>(const CreationKey& a, const CreationKey& b) {
  return b < a;
}

inline bool operator==(const CreationKey& a, const CreationKey& b) {
  return a.timestamp_ms == b.timestamp_ms && a.sequence == b.sequence;
}

inline bool operator!=(const CreationKey& a, const CreationKey& b) {
  return !(a == b);
}

// Used by gtest failure messages.
inline std::ostream& operator<<(std::ostream& os, const CreationKey& key) {
  return os << key.timestamp_ms << "#" << key.sequence;
}

}  // namespace domain
}  // namespace qless
