/***
 * Name: tether::handle::JoinHandle<T>
 * Purpose: Caller's side of a dispatched task: wait for it, poll it, cancel it.
 * Theory of Operation:
 *   Wraps the receiving end of the task's oneshot. A task whose message was dropped before it
 *   ran (its handle closed) resolves to CallError::Kind::Closed. join() waits in the GC-safe
 *   state and yields the result once; later calls report Closed.
 */
#pragma once

#include <optional>
#include <utility>

#include "tether/catch/CallResult.h"
#include "tether/handle/CancellationToken.h"
#include "tether/sync/Channel.h"
#include "tether/sync/Oneshot.h"

namespace tether::handle {

template <typename T>
class JoinHandle {
 public:
  JoinHandle(sync::OneshotReceiver<CallResult<T>> receiver, CancellationToken token)
      : receiver_(std::move(receiver)), token_(std::move(token)) {}

  CallResult<T> join() {
    std::optional<CallResult<T>> out = receiver_.recv();
    if (!out) { return std::unexpected(CallError::closed()); }
    return std::move(*out);
  }

  // nullopt while the task is still pending.
  std::optional<CallResult<T>> try_join() {
    std::optional<CallResult<T>> out;
    CallResult<T> value = std::unexpected(CallError::closed());
    switch (receiver_.try_recv(value)) {
      case sync::ChannelStatus::Ok: out.emplace(std::move(value)); break;
      case sync::ChannelStatus::Closed: out.emplace(std::unexpected(CallError::closed())); break;
      default: break;
    }
    return out;
  }

  bool is_finished() const { return receiver_.is_resolved(); }

  // Ask the task to stop at its next checkpoint.
  void cancel() const noexcept { token_.cancel(); }
  const CancellationToken& token() const noexcept { return token_; }

 private:
  sync::OneshotReceiver<CallResult<T>> receiver_;
  CancellationToken token_;
};

} // namespace tether::handle
