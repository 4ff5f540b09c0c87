// Repository: StreamTap
// Component: BackpressureQueue
// Purpose: Bounded FIFO between the engine's streaming thread and the
//          application thread. Full-queue behavior is either block
//          (backpressure into the engine) or leaky (evict oldest).
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_BUFFER_BACKPRESSURE_QUEUE_HPP_
#define STREAMTAP_BUFFER_BACKPRESSURE_QUEUE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "streamtap/runtime/Errors.hpp"

namespace streamtap::buffer {

enum class QueuePolicy {
  kBlock,  // Put() waits for space
  kLeaky,  // Put() evicts the oldest item and counts a drop
};

inline const char* QueuePolicyName(QueuePolicy policy) {
  return policy == QueuePolicy::kLeaky ? "leaky" : "block";
}

// BackpressureQueue<T> holds at most Capacity() items, FIFO.
//
// Producer: Put(). Under kBlock, waits until there is room or the queue is
// closed. Under kLeaky, never waits; a full queue evicts its oldest item
// (Dropped() increments, the drop callback sees the evicted item).
//
// Consumer: Pop(timeout) waits up to `timeout` for an item.
//
// Close() is one-way. It wakes every waiting producer (their Put() returns
// false without enqueuing) and makes later Put() calls fail at once. Items
// already queued stay poppable so a consumer can drain after shutdown.
//
// Thread safety: all public methods are safe to call from any thread.
template <typename T>
class BackpressureQueue {
 public:
  using DropCallback = std::function<void(const T&)>;

  // Throws ConfigurationError when capacity is 0.
  BackpressureQueue(size_t capacity, QueuePolicy policy,
                    DropCallback on_drop = nullptr)
      : capacity_(capacity), policy_(policy), on_drop_(std::move(on_drop)) {
    if (capacity_ == 0) {
      throw ConfigurationError("queue capacity must be at least 1");
    }
  }

  BackpressureQueue(const BackpressureQueue&) = delete;
  BackpressureQueue& operator=(const BackpressureQueue&) = delete;

  // --- Producer ---

  // Returns false if the queue was closed before the item could be enqueued.
  bool Put(T item) {
    std::optional<T> evicted;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (policy_ == QueuePolicy::kBlock) {
        not_full_cv_.wait(lock,
                          [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
      } else {
        if (closed_) return false;
        if (items_.size() >= capacity_) {
          evicted.emplace(std::move(items_.front()));
          items_.pop_front();
          ++drops_total_;
        }
      }
      items_.push_back(std::move(item));
      ++total_pushed_;
    }
    not_empty_cv_.notify_one();

    if (evicted && on_drop_) on_drop_(*evicted);
    return true;
  }

  // --- Consumer ---

  // Waits up to `timeout`. Returns nullopt if nothing arrived in time.
  std::optional<T> Pop(std::chrono::milliseconds timeout) {
    std::optional<T> out;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (!not_empty_cv_.wait_for(lock, timeout,
                                  [this] { return !items_.empty(); })) {
        return std::nullopt;
      }
      out.emplace(std::move(items_.front()));
      items_.pop_front();
      ++total_popped_;
    }
    not_full_cv_.notify_one();
    return out;
  }

  std::optional<T> TryPop() { return Pop(std::chrono::milliseconds(0)); }

  // --- Shutdown ---

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_full_cv_.notify_all();
    not_empty_cv_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  // --- Observability ---

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  bool Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
  }

  size_t Capacity() const { return capacity_; }
  QueuePolicy Policy() const { return policy_; }

  // Items evicted by a leaky Put(). Always 0 under kBlock.
  uint64_t Dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drops_total_;
  }

  uint64_t TotalPushed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_pushed_;
  }

  uint64_t TotalPopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_popped_;
  }

 private:
  const size_t capacity_;
  const QueuePolicy policy_;
  const DropCallback on_drop_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_cv_;
  std::condition_variable not_full_cv_;
  std::deque<T> items_;
  bool closed_ = false;

  uint64_t drops_total_ = 0;
  uint64_t total_pushed_ = 0;
  uint64_t total_popped_ = 0;
};

}  // namespace streamtap::buffer

#endif  // STREAMTAP_BUFFER_BACKPRESSURE_QUEUE_HPP_
