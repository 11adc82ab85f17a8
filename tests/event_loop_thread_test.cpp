// =============================================================================
// event_loop_thread_test.cpp
// =============================================================================
// Unit tests for qless::EventLoopThread.
//
// Validates:
//   - Events queued before start() are delivered, in order, once running
//   - stop() delivers everything still queued before joining
//   - OrderCreatedEvents waiting together are merged into one delivery;
//     status changes are never merged
//   - After a creation trigger is delivered, the next creation queues anew
//
// Events are pushed before start() so the worker cannot consume any of them
// early; every count below is therefore exact.
// =============================================================================

#include "qless/concurrent/event_loop_thread.hpp"
#include "qless/events/event_types.hpp"
#include "support/order_factory.hpp"

#include <gtest/gtest.h>

#include <vector>

using qless::domain::OrderStatus;

class EventLoopThreadTest : public ::testing::Test {
 protected:
  qless::EventLoopThread loop;
  std::vector<qless::domain::OrderId> created;
  std::vector<qless::domain::OrderId> changed;

  void SetUp() override {
    loop.eventBus().subscribe<qless::OrderCreatedEvent>(
        [this](const qless::OrderCreatedEvent& e) {
          created.push_back(e.order.id);
        });
    loop.eventBus().subscribe<qless::OrderStatusChangedEvent>(
        [this](const qless::OrderStatusChangedEvent& e) {
          changed.push_back(e.order.id);
        });
  }

  void pushCreated(qless::domain::OrderId id) {
    loop.push(qless::OrderCreatedEvent{qless::testing::makeOrder(id, 100)});
  }

  void pushReady(qless::domain::OrderId id) {
    loop.push(qless::OrderStatusChangedEvent{
        qless::testing::makeOrder(id, 100, 0, OrderStatus::Ready),
        OrderStatus::Preparing});
  }
};

// -----------------------------------------------------------------------------
// 1. Waiting creations share one delivery; every Ready is delivered.
// -----------------------------------------------------------------------------
TEST_F(EventLoopThreadTest, WaitingCreationsMergeStatusChangesDoNot) {
  pushCreated(1);
  pushReady(7);
  pushCreated(2);
  pushCreated(3);
  pushReady(8);
  pushReady(9);

  loop.start();
  loop.stop();

  ASSERT_EQ(created.size(), 1u);
  EXPECT_EQ(created[0], 1u);
  EXPECT_EQ(changed, (std::vector<qless::domain::OrderId>{7, 8, 9}));
  EXPECT_EQ(loop.coalescedCount(), 2u);
}

// -----------------------------------------------------------------------------
// 2. Once the trigger is delivered, a later creation is queued again.
// -----------------------------------------------------------------------------
TEST_F(EventLoopThreadTest, DeliveredTriggerReopensTheSlot) {
  pushCreated(1);
  pushCreated(2);
  loop.start();
  loop.stop();
  ASSERT_EQ(created.size(), 1u);

  pushCreated(3);
  loop.start();
  loop.stop();

  EXPECT_EQ(created, (std::vector<qless::domain::OrderId>{1, 3}));
  EXPECT_EQ(loop.coalescedCount(), 1u);
}

// -----------------------------------------------------------------------------
// 3. stop() without start() is a no-op; nothing is delivered.
// -----------------------------------------------------------------------------
TEST_F(EventLoopThreadTest, StopWithoutStartDeliversNothing) {
  pushReady(1);
  loop.stop();
  EXPECT_TRUE(changed.empty());
}
