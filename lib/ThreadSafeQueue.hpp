#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace qc {

/**
 * ThreadSafeQueue - A thread-safe wrapper around std::queue
 *
 * All public methods are thread-safe. Consumers either poll() or block in
 * waitPoll() for a bounded time.
 *
 * @tparam T The type of elements stored in the queue
 */
template <typename T> class ThreadSafeQueue {
public:
  ThreadSafeQueue() = default;
  ~ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue &) = delete;
  ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  void push(const T &value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(value);
    }
    cv_.notify_one();
  }

  void push(T &&value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(std::move(value));
    }
    cv_.notify_one();
  }

  /**
   * Push, then discard from the front until at most maxSize elements remain
   * @return Number of elements discarded
   */
  size_t pushBounded(T &&value, size_t maxSize) {
    size_t dropped = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(std::move(value));
      while (queue_.size() > maxSize) {
        queue_.pop();
        ++dropped;
      }
    }
    cv_.notify_one();
    return dropped;
  }

  /**
   * Poll an element from the front of the queue
   * @param t Reference to store the popped element
   * @return true if an element was popped, false if queue was empty
   */
  bool poll(T &t) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return false;
    }
    t = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  /**
   * Like poll(), but waits up to timeout for an element to arrive
   */
  template <typename Rep, typename Period>
  bool waitPoll(T &t, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return false;
    }
    t = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::queue<T> empty;
    queue_.swap(empty);
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> queue_;
};

} // namespace qc
