#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace qless {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO that many threads push to and pop from without data
// races. Blocking pop() waits for an item; try_pop() returns immediately.
//
// Two uses in the service:
//   - EventLoopThread: unbounded hand-off of order events from request
//     threads to the notification thread.
//   - RealtimeServer: bounded buffer of outbound channel messages. When a
//     subscriber is slow the buffer fills, try_push() starts refusing, and
//     the caller drops the message instead of waiting. A later snapshot
//     supersedes anything dropped.
//
// A capacity of 0 means unbounded.
//
// Thread model: Safe for multiple producers and multiple consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;
  explicit ThreadSafeQueue(std::size_t capacity) : capacity_(capacity) {}

  // Owns a mutex and condition variable; neither copies nor moves.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item regardless of capacity and wakes one waiter.
  // Use for hand-offs that must not lose items.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // try_push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item unless the queue already holds capacity() items.
  // Output: true if enqueued, false if refused (value is discarded).
  // Never blocks beyond the short critical section.
  // -------------------------------------------------------------------------
  bool try_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (capacity_ != 0 && queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting until one exists.
  // The predicate form of wait() absorbs spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  // Output: the front item, or std::nullopt if the queue was empty.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change it immediately after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;  // Signalled on every successful push
  std::deque<T> queue_;
  const std::size_t capacity_{0};
};

}  // namespace qless
