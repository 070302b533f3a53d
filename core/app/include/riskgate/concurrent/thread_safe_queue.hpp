#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace riskgate {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T> — MPMC hand-off with an optional drop-oldest bound
// -----------------------------------------------------------------------------
//
// @brief  FIFO between the admission threads, which produce telemetry, and
//         the IPC thread, which serializes and publishes it.
//
// @details
// Admission must never wait on telemetry, so push() never blocks. With a
// non-zero capacity, a push into a full queue evicts the oldest item and
// counts it in dropped(); the newest state of the book is worth more to a
// subscriber than a stale backlog. Capacity 0 means unbounded.
//
// Consumers block in pop() or poll with try_pop() / drain().
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Returns false if an older item had to be evicted to make room.
  bool push(T value) {
    bool evicted = false;
    {
      std::lock_guard lock(mutex_);
      if (capacity_ != 0 && items_.size() >= capacity_) {
        items_.pop_front();
        ++dropped_;
        evicted = true;
      }
      items_.push_back(std::move(value));
    }
    ready_.notify_one();
    return !evicted;
  }

  T pop() {
    std::unique_lock lock(mutex_);
    ready_.wait(lock, [this] { return !items_.empty(); });
    return takeFront();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    return takeFront();
  }

  // Everything queued, oldest first, taken under one lock so the caller's
  // slow work (serialization, socket sends) happens outside it.
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard lock(mutex_);
      taken.swap(items_);
    }
    return std::vector<T>(std::make_move_iterator(taken.begin()),
                          std::make_move_iterator(taken.end()));
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }

  // Items evicted by push() since construction.
  std::uint64_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  // Caller holds mutex_ and has checked non-empty.
  T takeFront() {
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<T> items_;
  std::uint64_t dropped_{0};
};

}  // namespace riskgate
