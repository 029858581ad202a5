#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>

namespace docqa_core::async {

/**
 * @class BoundedQueue
 * @brief Blocking multi-producer / multi-consumer queue with a fixed capacity.
 *
 * push() blocks while the queue is full, which is what keeps a large corpus
 * from being turned into an unbounded backlog of pending work.
 */
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedQueue capacity must be greater than 0");
    }
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Returns false if the queue was closed before the item could be enqueued.
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mtx_);
    not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    items_.push(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  // Blocks until an item is available; nullopt once closed and drained.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop();
    not_full_.notify_one();
    return item;
  }

  // Consumers drain what is left; producers are turned away.
  void close() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
  }

  size_t capacity() const {
    return capacity_;
  }

 private:
  const size_t capacity_;
  bool closed_ = false;
  std::queue<T> items_;
  mutable std::mutex mtx_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
};

}  // namespace docqa_core::async
