#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace dcm::monitor {

// EventChannel is a FIFO handoff from any number of producers to one consumer.
//
// Thread-safety: every member is safe to call concurrently.
// After close(), push() is refused but queued items can still be popped, so the
// consumer drains what was already delivered.
template <typename T>
class EventChannel {
 public:
  EventChannel() = default;
  ~EventChannel() = default;

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;
  EventChannel(EventChannel&&) = delete;
  EventChannel& operator=(EventChannel&&) = delete;

  // Returns false when the channel is closed; the item is dropped.
  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  [[nodiscard]] std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pop_locked();
  }

  // Blocks until an item arrives, the channel closes, notify() is called or
  // timeout elapses. Returns nullopt in every case but the first.
  template <typename Rep, typename Period>
  [[nodiscard]] std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto seen = wakeups_;
    cv_.wait_for(lock, timeout, [&] { return !items_.empty() || closed_ || wakeups_ != seen; });
    return pop_locked();
  }

  // Wakes a consumer blocked in pop_for without delivering an item.
  void notify() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++wakeups_;
    }
    cv_.notify_all();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

 private:
  std::optional<T> pop_locked() {
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_{false};
  unsigned long long wakeups_{0};
};

}  // namespace dcm::monitor
