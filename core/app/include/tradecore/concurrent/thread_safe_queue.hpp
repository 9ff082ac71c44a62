#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  Unbounded multi-producer / multi-consumer FIFO.
//
// @details
// Used where work crosses a thread boundary: the SimulatedOrderGateway's
// callers push submit/cancel requests and its worker thread pops them.
//
// Consumers never block indefinitely. pop_for() waits at most the given
// timeout so a worker can re-check its stop flag between waits, and drain()
// hands back whatever is left when the worker shuts down.
//
// Thread model: every method is safe from any thread. The mutex guards the
// deque; the condition variable is signalled once per push.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends value and wakes one consumer waiting in pop_for().
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // try_pop()
  // -------------------------------------------------------------------------
  // @brief  Removes and returns the front item, or std::nullopt when empty.
  //         Never blocks.
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

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  // @brief  Waits up to timeout for an item.
  //
  // @return The front item, or std::nullopt if the queue stayed empty for
  //         the whole timeout.
  //
  // @details
  // wait_for with a predicate absorbs spurious wakeups; the timeout bounds
  // how long a worker can go without re-checking its own stop flag.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // @brief  Removes every queued item at once, in FIFO order.
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::lock_guard lock(mutex_);
    std::vector<T> items;
    items.reserve(queue_.size());
    for (auto& item : queue_) {
      items.push_back(std::move(item));
    }
    queue_.clear();
    return items;
  }

  // Snapshot only; another thread may change the queue immediately after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace tradecore
