#pragma once

#include "qless/concurrent/thread_safe_queue.hpp"
#include "qless/eventbus/event_bus.hpp"
#include "qless/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace qless {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Request threads push(); the
// subscribers (the QueueBroadcaster) run only on the worker.
//
// This is how order mutations stay decoupled from notification: a request
// thread that just created or advanced an order pays for one queue push and
// returns. Snapshot reads, JSON building and transport hand-off happen later
// on the worker, one event at a time, so two broadcast cycles never
// interleave.
//
// Creation events only ask for a fresh snapshot, and one snapshot taken after
// several creations covers all of them. So push() keeps at most one
// OrderCreatedEvent waiting: while one is queued, further ones are counted
// and dropped. The worker clears the mark before publishing, so a creation
// that lands after the snapshot read always queues a new trigger. Status
// changes are never merged (each Ready must reach its customer), which
// bounds the backlog by the number of transitions rather than by request
// volume.
//
// Thread model: start() and stop() from the owning thread. push() from any
// thread. All EventBus callbacks run on the worker thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker so it cannot outlive the queue and bus it reads.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Spawns the worker. Idempotent while running.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Signals the worker, which publishes every event still queued and
  // then exits; joins it. Idempotent. start() may be called again after.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues one event for the worker, merging OrderCreatedEvents as
  // described above. Safe from any thread.
  void push(Event event);

  // OrderCreatedEvents absorbed by one already waiting.
  std::uint64_t coalescedCount() const { return coalesced_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  // Worker loop: try_pop → publish, otherwise short wait on stop_cv_.
  void run();

  void deliver(const Event& event);

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> created_pending_{false};
  std::atomic<std::uint64_t> coalesced_{0};

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace qless
