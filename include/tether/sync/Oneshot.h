/***
 * Name: tether::sync::OneshotSender<T>, OneshotReceiver<T>, oneshot<T>()
 * Purpose: Single-value channel used to resolve one task result.
 * Theory of Operation:
 *   The sender delivers at most one value. Dropping a sender that never sent closes the
 *   channel, so a receiver never waits for a value that can no longer arrive. recv() waits
 *   in the GC-safe state.
 */
#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "tether/sync/Channel.h"
#include "tether/sync/GcSafe.h"

namespace tether::sync {

namespace detail {
template <typename T>
struct OneshotState {
  std::mutex mu;
  std::condition_variable cv;
  std::optional<T> value;
  bool closed{false};
};
} // namespace detail

template <typename T>
class OneshotSender {
 public:
  explicit OneshotSender(std::shared_ptr<detail::OneshotState<T>> state) : state_(std::move(state)) {}
  OneshotSender(OneshotSender&&) noexcept = default;
  OneshotSender& operator=(OneshotSender&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  OneshotSender(const OneshotSender&) = delete;
  OneshotSender& operator=(const OneshotSender&) = delete;
  ~OneshotSender() { close(); }

  // False when a value was already sent or the sender was moved from.
  bool send(T value) {
    if (!state_) { return false; }
    {
      const std::lock_guard<std::mutex> lk(state_->mu);
      if (state_->closed) { return false; }
      state_->value.emplace(std::move(value));
      state_->closed = true;
    }
    state_->cv.notify_all();
    state_.reset();
    return true;
  }

 private:
  void close() noexcept {
    if (!state_) { return; }
    {
      const std::lock_guard<std::mutex> lk(state_->mu);
      state_->closed = true;
    }
    state_->cv.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::OneshotState<T>> state_;
};

template <typename T>
class OneshotReceiver {
 public:
  explicit OneshotReceiver(std::shared_ptr<detail::OneshotState<T>> state) : state_(std::move(state)) {}

  // The value, or nullopt when the sender was dropped without sending.
  std::optional<T> recv() {
    const GcSafeRegion safe;
    std::unique_lock<std::mutex> lk(state_->mu);
    state_->cv.wait(lk, [this] { return state_->closed; });
    return take_locked();
  }

  // Ok, Empty (not yet resolved) or Closed (sender dropped, or value already taken).
  ChannelStatus try_recv(T& out) {
    const std::lock_guard<std::mutex> lk(state_->mu);
    if (!state_->closed) { return ChannelStatus::Empty; }
    std::optional<T> value = take_locked();
    if (!value) { return ChannelStatus::Closed; }
    out = std::move(*value);
    return ChannelStatus::Ok;
  }

  bool is_resolved() const {
    const std::lock_guard<std::mutex> lk(state_->mu);
    return state_->closed;
  }

 private:
  std::optional<T> take_locked() {
    std::optional<T> out = std::move(state_->value);
    state_->value.reset();
    return out;
  }

  std::shared_ptr<detail::OneshotState<T>> state_;
};

template <typename T>
std::pair<OneshotSender<T>, OneshotReceiver<T>> oneshot() {
  auto state = std::make_shared<detail::OneshotState<T>>();
  return {OneshotSender<T>(state), OneshotReceiver<T>(state)};
}

} // namespace tether::sync
