/***
 * Name: tether::sync::Channel<T>, ChannelStatus
 * Purpose: FIFO channel between producer and worker threads, bounded or unbounded.
 * Inputs: Items of type T
 * Outputs: Items in send order; status codes for full, empty and closed channels
 * Theory of Operation:
 *   A deque under a mutex with two condition variables. capacity 0 means unbounded.
 *   Closing wakes every waiter; items already queued stay receivable, and receiving from a
 *   closed channel with nothing queued returns Closed at once.
 *
 *   Blocking calls wait in the GC-safe state. The unique_lock is scoped inside the
 *   GcSafeRegion so the channel mutex is released before the thread becomes a mutator again.
 *   try_send leaves the item with the caller unless it returns Ok.
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

#include "tether/sync/GcSafe.h"

namespace tether::sync {

enum class ChannelStatus : uint8_t {
  Ok = 0,
  Full,   // bounded channel at capacity; retry later
  Closed, // terminal
  Empty   // nothing queued yet; retry later
};

const char* to_string(ChannelStatus status);

template <typename T>
class Channel {
 public:
  explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}
  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  ChannelStatus try_send(T& item) {
    {
      const std::lock_guard<std::mutex> lk(mu_);
      if (closed_) { return ChannelStatus::Closed; }
      if (!has_room()) { return ChannelStatus::Full; }
      items_.push_back(std::move(item));
    }
    notEmpty_.notify_one();
    return ChannelStatus::Ok;
  }

  // Blocks while full. Ok or Closed; on Closed the item stays with the caller.
  ChannelStatus send(T& item) {
    const ChannelStatus fast = try_send(item);
    if (fast != ChannelStatus::Full) { return fast; }
    {
      const GcSafeRegion safe;
      std::unique_lock<std::mutex> lk(mu_);
      notFull_.wait(lk, [this] { return closed_ || has_room(); });
      if (closed_) { return ChannelStatus::Closed; }
      items_.push_back(std::move(item));
    }
    notEmpty_.notify_one();
    return ChannelStatus::Ok;
  }

  ChannelStatus try_recv(T& out) {
    {
      const std::lock_guard<std::mutex> lk(mu_);
      if (items_.empty()) { return closed_ ? ChannelStatus::Closed : ChannelStatus::Empty; }
      out = std::move(items_.front());
      items_.pop_front();
    }
    notFull_.notify_one();
    return ChannelStatus::Ok;
  }

  // Blocks while empty and open. Ok or Closed.
  ChannelStatus recv(T& out) {
    const ChannelStatus fast = try_recv(out);
    if (fast != ChannelStatus::Empty) { return fast; }
    {
      const GcSafeRegion safe;
      std::unique_lock<std::mutex> lk(mu_);
      notEmpty_.wait(lk, [this] { return closed_ || !items_.empty(); });
      if (items_.empty()) { return ChannelStatus::Closed; }
      out = std::move(items_.front());
      items_.pop_front();
    }
    notFull_.notify_one();
    return ChannelStatus::Ok;
  }

  void close() {
    {
      const std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
  }

  // Remove and return everything still queued.
  std::deque<T> drain() {
    std::deque<T> out;
    {
      const std::lock_guard<std::mutex> lk(mu_);
      out.swap(items_);
    }
    notFull_.notify_all();
    return out;
  }

  bool is_closed() const {
    const std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  std::size_t size() const {
    const std::lock_guard<std::mutex> lk(mu_);
    return items_.size();
  }

  std::size_t capacity() const noexcept { return capacity_; }

 private:
  bool has_room() const { return capacity_ == 0 || items_.size() < capacity_; }

  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable notEmpty_;
  std::condition_variable notFull_;
  std::deque<T> items_;
  bool closed_{false};
};

} // namespace tether::sync
