#include "qless/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <utility>
#include <variant>

namespace qless {

namespace {

// Idle wait between queue polls. Bounds how late stop() is noticed.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// push(): at most one creation trigger waiting
// -----------------------------------------------------------------------------
void EventLoopThread::push(Event event) {
  if (std::holds_alternative<OrderCreatedEvent>(event) &&
      created_pending_.exchange(true)) {
    coalesced_.fetch_add(1);
    return;
  }
  queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// deliver(): clear the creation mark before subscribers read the repository
// -----------------------------------------------------------------------------
void EventLoopThread::deliver(const Event& event) {
  if (std::holds_alternative<OrderCreatedEvent>(event)) {
    created_pending_.store(false);
  }
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      deliver(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }

  // Final drain: events accepted before stop() are still delivered.
  while (auto event = queue_.try_pop()) {
    deliver(*event);
  }
}

}  // namespace qless
