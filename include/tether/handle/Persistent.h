/***
 * Name: tether::handle::PersistentHandle<P>, make_persistent_task
 * Purpose: Long-lived tasks that keep rooted state and serve repeated calls.
 * Inputs: A task object P (see below) and the capacity of its call channel
 * Outputs: A PersistentHandle<P> once P::init succeeds; one JoinHandle per call
 * Theory of Operation:
 *   P provides
 *     using State, Input, Output;                       (Output is not void)
 *     Async<State> init(AsyncFrame& frame);
 *     Async<Output> run(AsyncFrame& frame, State& state, Input input);
 *   and optionally
 *     Async<void> exit(AsyncFrame& frame, State& state);
 *
 *   init runs in the task's base frame, so values it roots there (and returns as State) stay
 *   valid for the task's whole life. Each call runs in a child scope that is popped when the
 *   call finishes. Calls are served one at a time in the order they were queued.
 *
 *   The task ends when its channel closes: when the last PersistentHandle copy is dropped,
 *   close() is called, or the runtime shuts down. Calls already queued are still served
 *   (unless the runtime was closed with cancel), then exit runs. The task holds one task
 *   slot until it ends; while idle it polls its channel once per scheduler turn.
 */
#pragma once

#include <concepts>
#include <cstddef>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "tether/catch/CallResult.h"
#include "tether/handle/Async.h"
#include "tether/handle/CancellationToken.h"
#include "tether/handle/JoinHandle.h"
#include "tether/handle/Message.h"
#include "tether/observability/Metrics.h"
#include "tether/support/Debug.h"
#include "tether/sync/Channel.h"
#include "tether/sync/Oneshot.h"

namespace tether::handle {

template <typename P>
struct PersistentCall {
  std::optional<typename P::Input> input;
  std::optional<sync::OneshotSender<CallResult<typename P::Output>>> result;
};

template <typename P>
using PersistentChannel = sync::Channel<PersistentCall<P>>;

template <typename P>
class PersistentHandle {
 public:
  using Input = typename P::Input;
  using Output = typename P::Output;

  explicit PersistentHandle(std::shared_ptr<PersistentChannel<P>> calls)
      : owner_(std::make_shared<Owner>(std::move(calls))) {}

  // Full leaves the call unsent; Closed means the task has ended.
  std::expected<JoinHandle<Output>, sync::ChannelStatus> try_call(Input input) {
    auto [tx, rx] = sync::oneshot<CallResult<Output>>();
    PersistentCall<P> msg{std::move(input), std::move(tx)};
    const sync::ChannelStatus status = owner_->calls->try_send(msg);
    if (status != sync::ChannelStatus::Ok) { return std::unexpected(status); }
    return JoinHandle<Output>(std::move(rx), CancellationToken{});
  }

  // Waits for room. A call to a task that has ended resolves Closed.
  JoinHandle<Output> call(Input input) {
    auto [tx, rx] = sync::oneshot<CallResult<Output>>();
    PersistentCall<P> msg{std::move(input), std::move(tx)};
    if (owner_->calls->send(msg) != sync::ChannelStatus::Ok) { msg.result.reset(); }
    return JoinHandle<Output>(std::move(rx), CancellationToken{});
  }

  void close() { owner_->calls->close(); }
  bool is_closed() const { return owner_->calls->is_closed(); }
  std::size_t pending() const { return owner_->calls->size(); }

 private:
  struct Owner {
    std::shared_ptr<PersistentChannel<P>> calls;

    explicit Owner(std::shared_ptr<PersistentChannel<P>> c) : calls(std::move(c)) {}
    Owner(const Owner&) = delete;
    Owner& operator=(const Owner&) = delete;
    ~Owner() { calls->close(); }
  };

  std::shared_ptr<Owner> owner_;
};

namespace detail {

template <typename P>
concept HasExit = requires(P& task, AsyncFrame& frame, typename P::State& state) {
  { task.exit(frame, state) } -> std::same_as<Async<void>>;
};

template <typename P>
Async<void> run_persistent(AsyncFrame& frame, P task, std::shared_ptr<PersistentChannel<P>> calls,
                           sync::OneshotSender<CallResult<PersistentHandle<P>>> started,
                           std::shared_ptr<obs::Metrics> metrics) {
  using Output = typename P::Output;
  std::optional<typename P::State> state;
  std::exception_ptr initError;
  try {
    state.emplace(co_await task.init(frame));
  } catch (...) {
    initError = std::current_exception();
  }
  if (initError) {
    resolve(*metrics, started, CallResult<PersistentHandle<P>>(std::unexpected(CallError::from_host(initError))));
    co_return;
  }
  resolve(*metrics, started, CallResult<PersistentHandle<P>>(PersistentHandle<P>(calls)));

  for (;;) {
    PersistentCall<P> call;
    const sync::ChannelStatus status = calls->try_recv(call);
    if (status == sync::ChannelStatus::Closed) { break; }
    if (status != sync::ChannelStatus::Ok) {
      co_await frame.yield_now();
      continue;
    }
    CallResult<Output> out = std::unexpected(CallError::closed());
    try {
      out = CallResult<Output>(std::in_place, co_await frame.async_scope([&](AsyncFrame& child) {
        return task.run(child, *state, std::move(*call.input));
      }));
    } catch (...) {
      out = std::unexpected(CallError::from_host(std::current_exception()));
    }
    resolve(*metrics, *call.result, std::move(out));
  }

  if constexpr (HasExit<P>) {
    co_await frame.async_scope([&](AsyncFrame& child) { return task.exit(child, *state); });
  }
  support::debug_log("async", "persistent task finished");
}

} // namespace detail

// Wrap a persistent task into a message plus the handle that receives its PersistentHandle.
template <typename P>
auto make_persistent_task(P task, std::shared_ptr<PersistentChannel<P>> calls, std::shared_ptr<obs::Metrics> metrics)
    -> std::pair<PersistentMessage, JoinHandle<PersistentHandle<P>>> {
  static_assert(!std::is_void_v<typename P::Output>, "persistent task output must not be void");
  auto [tx, rx] = sync::oneshot<CallResult<PersistentHandle<P>>>();
  CancellationToken token;
  PersistentMessage msg{[task = std::move(task), calls = std::move(calls), tx = std::move(tx),
                         metrics = std::move(metrics)](AsyncFrame& frame) mutable {
                          return detail::run_persistent<P>(frame, std::move(task), std::move(calls), std::move(tx),
                                                           std::move(metrics));
                        },
                        token};
  return {std::move(msg), JoinHandle<PersistentHandle<P>>(std::move(rx), std::move(token))};
}

} // namespace tether::handle
