#pragma once

#include <mutex>
#include <queue>

namespace cl {

/**
 * ThreadSafeQueue - std::queue behind a mutex.
 * Consumers poll; there is no blocking pop.
 */
template <typename T> class ThreadSafeQueue {
public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue &) = delete;
  ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

  void push(const T &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(value);
  }

  void push(T &&value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
  }

  /**
   * @return true if an element was moved into t, false if the queue was empty
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

private:
  mutable std::mutex mutex_;
  std::queue<T> queue_;
};

} // namespace cl
