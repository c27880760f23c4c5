/***
 * Name: tether::handle::Dispatch<T>
 * Purpose: A message bound for an async runtime, not yet queued.
 * Theory of Operation:
 *   try_dispatch() never blocks: Full keeps the message here so the caller can retry, Closed
 *   drops it. dispatch() waits for room (GC-safe when called from a mutator). A successful
 *   send, or a Closed result, spends the Dispatch; using it again throws InvalidHandleState.
 *   The Dispatch does not keep the runtime alive; once its handle is closed every send
 *   reports Closed.
 */
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <utility>

#include "tether/exceptions/invalid_handle_state.h"
#include "tether/handle/JoinHandle.h"
#include "tether/handle/Message.h"
#include "tether/handle/detail/AsyncState.h"
#include "tether/observability/Metrics.h"
#include "tether/sync/Channel.h"

namespace tether::handle {

template <typename T>
class Dispatch {
 public:
  Dispatch(std::shared_ptr<detail::AsyncState> state, Envelope envelope, JoinHandle<T> handle)
      : state_(std::move(state)), envelope_(std::move(envelope)), handle_(std::move(handle)) {}

  std::expected<JoinHandle<T>, sync::ChannelStatus> try_dispatch() {
    check_unspent();
    sync::Channel<Envelope>& queue = state_->queue_for(envelope_.affinity);
    const sync::ChannelStatus status = queue.try_send(envelope_);
    switch (status) {
      case sync::ChannelStatus::Ok: return take_sent();
      case sync::ChannelStatus::Full: return std::unexpected(status);
      default:
        drop();
        return std::unexpected(sync::ChannelStatus::Closed);
    }
  }

  // A dispatch to a closed runtime returns a handle that resolves Closed.
  JoinHandle<T> dispatch() {
    check_unspent();
    sync::Channel<Envelope>& queue = state_->queue_for(envelope_.affinity);
    if (queue.send(envelope_) == sync::ChannelStatus::Ok) { return take_sent(); }
    JoinHandle<T> out = std::move(*handle_);
    drop();
    return out;
  }

  bool is_spent() const noexcept { return !handle_.has_value(); }
  Affinity affinity() const noexcept { return envelope_.affinity; }

 private:
  void check_unspent() const {
    if (!handle_) { throw exceptions::InvalidHandleState("dispatch already used"); }
  }

  JoinHandle<T> take_sent() {
    state_->metrics()->incCounter(obs::kTasksDispatched);
    JoinHandle<T> out = std::move(*handle_);
    handle_.reset();
    return out;
  }

  void drop() {
    envelope_.message = Message{};
    handle_.reset();
  }

  std::shared_ptr<detail::AsyncState> state_;
  Envelope envelope_;
  std::optional<JoinHandle<T>> handle_;
};

} // namespace tether::handle
