// =============================================================================
// queue_broadcaster_test.cpp
// =============================================================================
// Unit tests for qless::QueueBroadcaster.
//
// Validates:
//   - One cycle publishes global, one order:{id} per active order, kitchen
//   - global and kitchen carry the identical board; every per-order
//     position agrees with the board
//   - Arrival at Ready sends order:ready and a null-position update to the
//     order's own channel, before the cycle that no longer lists it
//   - Transport failures are swallowed; the rest of the cycle still runs
//   - A failing snapshot read skips the cycle without throwing
//
// Design:
//   Events are published straight onto a local EventBus, so every cycle
//   runs synchronously on the test thread.
// =============================================================================

#include "qless/broadcast/channel_keys.hpp"
#include "qless/broadcast/queue_broadcaster.hpp"
#include "qless/repository/in_memory_order_repository.hpp"
#include "support/order_factory.hpp"
#include "support/recording_transport.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using qless::domain::OrderStatus;
using qless::testing::makeOrder;

namespace {

// Repository whose listActive() always throws.
class UnreadableRepository final : public qless::IOrderRepository {
 public:
  qless::domain::Order insert(qless::domain::Order order) override {
    return order;
  }
  std::optional<qless::domain::Order> get(qless::domain::OrderId) const override {
    return std::nullopt;
  }
  std::vector<qless::domain::Order> listActive() const override {
    throw std::runtime_error("storage offline");
  }
  std::vector<qless::domain::Order> listByOwner(
      const std::string&, std::optional<OrderStatus>,
      std::size_t) const override {
    return {};
  }
  std::vector<qless::domain::Order> listHistory(
      const qless::HistoryFilter&) const override {
    return {};
  }
  qless::domain::Order updateStatus(qless::domain::OrderId, OrderStatus,
                                    OrderStatus,
                                    qless::domain::Timestamp) override {
    throw std::runtime_error("storage offline");
  }
};

}  // namespace

class QueueBroadcasterTest : public ::testing::Test {
 protected:
  qless::EventBus bus;
  qless::InMemoryOrderRepository repo;
  qless::testing::RecordingTransport transport;
  qless::QueueBroadcaster broadcaster{bus, repo, transport};

  void SetUp() override {
    repo.insert(makeOrder(1, 100, 0, OrderStatus::Pending, "Ana"));
    repo.insert(makeOrder(2, 100, 1, OrderStatus::Preparing, "Ben"));
    repo.insert(makeOrder(3, 101, 0, OrderStatus::Pending, "Cy"));
    repo.insert(makeOrder(4, 99, 0, OrderStatus::Ready, "Di"));
  }

  void advance(qless::domain::OrderId id, OrderStatus to) {
    const auto before = repo.get(id)->status;
    const auto after = repo.updateStatus(id, before, to, {});
    bus.publish(qless::OrderStatusChangedEvent{after, before});
  }
};

// -----------------------------------------------------------------------------
// 1. A creation event runs one cycle over all three audiences.
// -----------------------------------------------------------------------------
TEST_F(QueueBroadcasterTest, CycleCoversThreeAudiences) {
  bus.publish(qless::OrderCreatedEvent{*repo.get(3)});

  const auto sent = transport.sent();
  ASSERT_EQ(sent.size(), 5u);  // global + 3 active orders + kitchen
  EXPECT_EQ(sent.front().channel, qless::kGlobalChannel);
  EXPECT_EQ(sent.back().channel, qless::kKitchenChannel);
  EXPECT_EQ(sent[1].channel, "order:1");
  EXPECT_EQ(sent[2].channel, "order:2");
  EXPECT_EQ(sent[3].channel, "order:3");
  EXPECT_EQ(broadcaster.cycles(), 1u);
}

// -----------------------------------------------------------------------------
// 2. All three channels agree within one cycle.
// -----------------------------------------------------------------------------
TEST_F(QueueBroadcasterTest, SnapshotIsConsistentAcrossChannels) {
  broadcaster.broadcastQueue();

  const auto global = transport.on(qless::kGlobalChannel);
  const auto kitchen = transport.on(qless::kKitchenChannel);
  ASSERT_EQ(global.size(), 1u);
  ASSERT_EQ(kitchen.size(), 1u);

  EXPECT_EQ(global[0]["event"], "queue:update");
  EXPECT_EQ(kitchen[0]["event"], "kitchen:queue");
  EXPECT_EQ(global[0]["data"], kitchen[0]["data"]);

  const auto& board = global[0]["data"];
  ASSERT_EQ(board.size(), 3u);
  EXPECT_EQ(board[0]["orderId"], "1");
  EXPECT_EQ(board[0]["displayName"], "Ana");
  EXPECT_EQ(board[0]["status"], "pending");
  EXPECT_EQ(board[1]["orderId"], "2");
  EXPECT_EQ(board[1]["status"], "preparing");
  EXPECT_EQ(board[2]["orderId"], "3");

  for (std::size_t i = 0; i < board.size(); ++i) {
    EXPECT_EQ(board[i]["queuePosition"], i + 1);

    const std::string id = board[i]["orderId"];
    const auto own = transport.on("order:" + id);
    ASSERT_EQ(own.size(), 1u) << "order " << id;
    EXPECT_EQ(own[0]["event"], "queue:position");
    EXPECT_EQ(own[0]["data"]["orderId"], id);
    EXPECT_EQ(own[0]["data"]["queuePosition"], board[i]["queuePosition"]);
    EXPECT_EQ(own[0]["data"]["status"], board[i]["status"]);
  }

  // The Ready order has left the queue and gets no position message.
  EXPECT_TRUE(transport.on("order:4").empty());
}

// -----------------------------------------------------------------------------
// 3. Preparing → Ready: order:ready, then a null position, then the cycle.
// -----------------------------------------------------------------------------
TEST_F(QueueBroadcasterTest, ReadyArrivalNotifiesOwnChannelFirst) {
  advance(2, OrderStatus::Ready);

  const auto sent = transport.sent();
  ASSERT_GE(sent.size(), 3u);

  EXPECT_EQ(sent[0].channel, "order:2");
  EXPECT_EQ(sent[0].message["event"], "order:ready");
  EXPECT_EQ(sent[0].message["data"]["orderId"], "2");

  EXPECT_EQ(sent[1].channel, "order:2");
  EXPECT_EQ(sent[1].message["event"], "queue:position");
  EXPECT_TRUE(sent[1].message["data"]["queuePosition"].is_null());
  EXPECT_EQ(sent[1].message["data"]["status"], "ready");

  EXPECT_EQ(sent[2].channel, qless::kGlobalChannel);
  const auto& board = sent[2].message["data"];
  ASSERT_EQ(board.size(), 2u);
  EXPECT_EQ(board[0]["orderId"], "1");
  EXPECT_EQ(board[1]["orderId"], "3");
  EXPECT_EQ(board[1]["queuePosition"], 2);

  // No second order:2 message after the null position.
  EXPECT_EQ(transport.on("order:2").size(), 2u);
}

// -----------------------------------------------------------------------------
// 4. Other transitions only run the cycle.
// -----------------------------------------------------------------------------
TEST_F(QueueBroadcasterTest, NonReadyTransitionOnlyBroadcasts) {
  advance(1, OrderStatus::Preparing);
  advance(4, OrderStatus::Completed);

  for (const auto& s : transport.sent()) {
    EXPECT_NE(s.message["event"], "order:ready");
  }
  EXPECT_EQ(broadcaster.cycles(), 2u);
}

// -----------------------------------------------------------------------------
// 5. A failing channel is logged and skipped; the others still go out.
// -----------------------------------------------------------------------------
TEST_F(QueueBroadcasterTest, DeliveryFailureIsSwallowed) {
  transport.failOn(qless::kGlobalChannel);

  EXPECT_NO_THROW(bus.publish(qless::OrderCreatedEvent{*repo.get(1)}));

  EXPECT_TRUE(transport.on(qless::kGlobalChannel).empty());
  EXPECT_EQ(transport.on(qless::kKitchenChannel).size(), 1u);
  EXPECT_EQ(transport.on("order:3").size(), 1u);
  EXPECT_EQ(broadcaster.deliveryFailures(), 1u);
}

TEST_F(QueueBroadcasterTest, TotalTransportOutageIsSwallowed) {
  transport.failAll();

  EXPECT_NO_THROW(advance(2, OrderStatus::Ready));
  EXPECT_TRUE(transport.sent().empty());
  // order:ready + null position + global + 2 per-order + kitchen
  EXPECT_EQ(broadcaster.deliveryFailures(), 6u);
}

// -----------------------------------------------------------------------------
// 6. An empty queue still publishes empty boards.
// -----------------------------------------------------------------------------
TEST(QueueBroadcasterEmptyTest, EmptyQueuePublishesEmptyBoards) {
  qless::EventBus bus;
  qless::InMemoryOrderRepository repo;
  qless::testing::RecordingTransport transport;
  qless::QueueBroadcaster broadcaster(bus, repo, transport);

  broadcaster.broadcastQueue();

  const auto sent = transport.sent();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_TRUE(sent[0].message["data"].empty());
  EXPECT_TRUE(sent[1].message["data"].empty());
}

// -----------------------------------------------------------------------------
// 7. A failing snapshot read skips the cycle and does not throw.
// -----------------------------------------------------------------------------
TEST(QueueBroadcasterReadFailureTest, UnreadableSnapshotSkipsCycle) {
  qless::EventBus bus;
  UnreadableRepository repo;
  qless::testing::RecordingTransport transport;
  qless::QueueBroadcaster broadcaster(bus, repo, transport);

  EXPECT_NO_THROW(bus.publish(qless::OrderCreatedEvent{makeOrder(1, 100)}));
  EXPECT_TRUE(transport.sent().empty());
  EXPECT_EQ(broadcaster.cycles(), 0u);
}

// -----------------------------------------------------------------------------
// 8. Destruction unsubscribes from the bus.
// -----------------------------------------------------------------------------
TEST(QueueBroadcasterLifetimeTest, DestructorUnsubscribes) {
  qless::EventBus bus;
  qless::InMemoryOrderRepository repo;
  qless::testing::RecordingTransport transport;
  {
    qless::QueueBroadcaster broadcaster(bus, repo, transport);
    EXPECT_EQ(bus.subscriberCount(), 2u);
  }
  EXPECT_EQ(bus.subscriberCount(), 0u);
}
