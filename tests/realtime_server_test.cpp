// =============================================================================
// realtime_server_test.cpp
// =============================================================================
// Unit tests for the outbound side of qless::RealtimeServer.
//
// Validates:
//   - publish() buffers up to the configured capacity, then refuses with
//     NotificationDeliveryFailure and counts the drop
//   - Capacity 0 means unbounded
//   - stop() without start() is a no-op
//
// Design:
//   publish() only enqueues, so none of these tests call start(): no socket
//   is bound and no worker thread drains the buffer.
// =============================================================================

#include "qless/network/realtime_server.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(RealtimeServerTest, FullBufferDropsAndCounts) {
  qless::RealtimeServer server("tcp://127.0.0.1:5556", "tcp://127.0.0.1:5557",
                               2);

  EXPECT_NO_THROW(server.publish("global", "{\"n\":1}"));
  EXPECT_NO_THROW(server.publish("kitchen", "{\"n\":2}"));
  EXPECT_EQ(server.droppedCount(), 0u);

  EXPECT_THROW(server.publish("order:7", "{\"n\":3}"),
               qless::NotificationDeliveryFailure);
  EXPECT_EQ(server.droppedCount(), 1u);

  EXPECT_THROW(server.publish("global", "{\"n\":4}"),
               qless::NotificationDeliveryFailure);
  EXPECT_EQ(server.droppedCount(), 2u);
}

TEST(RealtimeServerTest, ZeroCapacityIsUnbounded) {
  qless::RealtimeServer server("tcp://127.0.0.1:5556", "tcp://127.0.0.1:5557",
                               0);

  for (int i = 0; i < 10'000; ++i) {
    server.publish("global", std::to_string(i));
  }
  EXPECT_EQ(server.droppedCount(), 0u);
}

TEST(RealtimeServerTest, StopWithoutStartIsNoOp) {
  qless::RealtimeServer server;
  EXPECT_FALSE(server.isRunning());
  EXPECT_NO_THROW(server.stop());
  EXPECT_FALSE(server.isRunning());
}
