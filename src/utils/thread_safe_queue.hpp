#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

// Multi-producer, multi-consumer queue. With a non-zero capacity, push()
// blocks while the queue is full so a fast producer cannot outrun the
// consumers.
template <typename T> class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(size_t capacity = 0) : capacity_(capacity) {}

  // Returns false if the queue was shut down before the value was accepted
  bool push(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
      return capacity_ == 0 || queue_.size() < capacity_ || shutdown_requested_;
    });
    if (shutdown_requested_)
      return false;
    queue_.push(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  // A non-blocking try_pop
  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
      return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop();
    not_full_.notify_one();
    return value;
  }

  // Blocks until a value is available. Returns std::nullopt once the queue
  // is shut down and drained
  std::optional<T> wait_and_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock,
                    [this] { return !queue_.empty() || shutdown_requested_; });
    if (queue_.empty())
      return std::nullopt;

    T value = std::move(queue_.front());
    queue_.pop();
    not_full_.notify_one();
    return value;
  }

  // Wake every waiter; values already queued can still be popped
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_requested_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  mutable std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  size_t capacity_;
  bool shutdown_requested_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
