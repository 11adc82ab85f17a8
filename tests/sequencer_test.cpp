// =============================================================================
// sequencer_test.cpp
// =============================================================================
// Unit tests for qless::Sequencer.
//
// Validates:
//   - Keys are strictly increasing while the clock stands still
//   - A new millisecond restarts the tie-break counter
//   - A clock that steps backwards never produces a smaller key
//   - 50 threads racing on one frozen millisecond get 50 distinct keys
//
// The clock is a SimulationTimeProvider so "same millisecond" is exact.
// =============================================================================

#include "qless/concurrent/sequencer.hpp"
#include "qless/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using qless::domain::CreationKey;

class SequencerTest : public ::testing::Test {
 protected:
  qless::SimulationTimeProvider clock{1'700'000'000'000};
  qless::Sequencer sequencer{clock};
};

// -----------------------------------------------------------------------------
// 1. Frozen clock: same timestamp, sequence 0, 1, 2, …
// -----------------------------------------------------------------------------
TEST_F(SequencerTest, FrozenClockIncrementsSequence) {
  const CreationKey a = sequencer.next();
  const CreationKey b = sequencer.next();
  const CreationKey c = sequencer.next();

  EXPECT_EQ(a, (CreationKey{1'700'000'000'000, 0}));
  EXPECT_EQ(b, (CreationKey{1'700'000'000'000, 1}));
  EXPECT_EQ(c, (CreationKey{1'700'000'000'000, 2}));
  EXPECT_LT(a, b);
  EXPECT_LT(b, c);
}

// -----------------------------------------------------------------------------
// 2. Advancing the clock adopts the new timestamp and restarts sequence.
// -----------------------------------------------------------------------------
TEST_F(SequencerTest, NewMillisecondRestartsSequence) {
  sequencer.next();
  sequencer.next();

  clock.advance_by(1);
  const CreationKey k = sequencer.next();

  EXPECT_EQ(k.timestamp_ms, 1'700'000'000'001);
  EXPECT_EQ(k.sequence, 0u);
}

// -----------------------------------------------------------------------------
// 3. A backwards clock step keeps the last timestamp and keeps counting.
// -----------------------------------------------------------------------------
TEST_F(SequencerTest, BackwardsClockStillIncreases) {
  clock.advance_time(5000);
  const CreationKey before = sequencer.next();

  clock.advance_time(4000);  // NTP stepped the wall clock back one second
  const CreationKey after_1 = sequencer.next();
  const CreationKey after_2 = sequencer.next();

  EXPECT_LT(before, after_1);
  EXPECT_LT(after_1, after_2);
  EXPECT_EQ(after_1.timestamp_ms, 5000);

  clock.advance_time(6000);
  const CreationKey caught_up = sequencer.next();
  EXPECT_EQ(caught_up, (CreationKey{6000, 0}));
}

// -----------------------------------------------------------------------------
// 4. A long run of mixed clock movements is strictly increasing throughout.
// -----------------------------------------------------------------------------
TEST_F(SequencerTest, MonotonicAcrossMixedClockMovement) {
  const std::vector<std::int64_t> readings = {10, 10, 12, 11, 11, 30, 5, 30, 31};

  CreationKey previous = sequencer.next();
  for (auto ms : readings) {
    clock.advance_time(ms);
    const CreationKey k = sequencer.next();
    EXPECT_LT(previous, k) << "at clock reading " << ms;
    previous = k;
  }
}

// -----------------------------------------------------------------------------
// 5. 50 threads, one frozen millisecond: 50 distinct keys, sequence 0..49.
// -----------------------------------------------------------------------------
TEST_F(SequencerTest, ConcurrentCallersGetDistinctKeys) {
  constexpr int kThreads = 50;

  std::mutex mutex;
  std::vector<CreationKey> keys;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, &mutex, &keys] {
      const CreationKey k = sequencer.next();
      std::lock_guard lock(mutex);
      keys.push_back(k);
    });
  }
  for (auto& t : threads) t.join();

  ASSERT_EQ(keys.size(), static_cast<std::size_t>(kThreads));

  std::sort(keys.begin(), keys.end());
  for (int i = 0; i < kThreads; ++i) {
    EXPECT_EQ(keys[i].timestamp_ms, 1'700'000'000'000);
    EXPECT_EQ(keys[i].sequence, static_cast<std::uint32_t>(i));
  }
}
