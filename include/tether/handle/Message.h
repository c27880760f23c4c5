/***
 * Name: tether::handle messages (Affinity, TaskMessage, BlockingTaskMessage, IncludeMessage,
 *   ErrorColorMessage, PersistentMessage, Message, Envelope)
 * Purpose: Units of work sent to async runtime threads.
 * Theory of Operation:
 *   Message is a closed variant; runtime threads dispatch on it with std::visit. Task payloads
 *   are type-erased into move-only callables that carry their own result sender, so each
 *   message is consumed once and resolves its result once. A message that is destroyed
 *   without running drops its sender and the caller's JoinHandle reports Closed.
 *
 *   Task bodies return either a value or a CallResult; a CallResult is flattened so a task
 *   that forwards a foreign exception reports it as Exception.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "tether/catch/CallResult.h"
#include "tether/catch/Catch.h"
#include "tether/handle/Async.h"
#include "tether/handle/CancellationToken.h"
#include "tether/handle/JoinHandle.h"
#include "tether/memory/Frame.h"
#include "tether/observability/Metrics.h"
#include "tether/sync/Oneshot.h"

namespace tether::handle {

enum class Affinity : uint8_t {
  ToAny = 0,
  ToMain,
  ToWorker
};

const char* to_string(Affinity affinity);

struct TaskMessage {
  std::move_only_function<Async<void>(AsyncFrame&)> start;
  CancellationToken token;
};

struct BlockingTaskMessage {
  std::move_only_function<void(memory::GcFrame&)> run;
};

struct IncludeMessage {
  std::string path;
  sync::OneshotSender<CallResult<void>> result;
};

struct ErrorColorMessage {
  bool enabled{false};
  sync::OneshotSender<CallResult<bool>> result;
};

// Starts a long-lived task that serves calls from its own channel (see Persistent.h).
struct PersistentMessage {
  std::move_only_function<Async<void>(AsyncFrame&)> start;
  CancellationToken token;
};

using Message =
    std::variant<TaskMessage, BlockingTaskMessage, IncludeMessage, ErrorColorMessage, PersistentMessage>;

struct Envelope {
  Affinity affinity{Affinity::ToAny};
  Message message;
};

template <typename T>
struct TaskResult {
  using value_type = T;
  static CallResult<T> flatten(CallResult<T>&& result) { return std::move(result); }
};

template <typename U>
struct TaskResult<CallResult<U>> {
  using value_type = U;
  static CallResult<U> flatten(CallResult<CallResult<U>>&& result) {
    if (!result) { return std::unexpected(std::move(result.error())); }
    return std::move(*result);
  }
};

template <typename T>
using TaskValue = typename TaskResult<T>::value_type;

// Value type of a task body F(AsyncFrame&) -> Async<T>.
template <typename F>
using TaskBodyValue = typename AsyncValue<std::invoke_result_t<F&, AsyncFrame&>>::type;

namespace detail {

// Count one resolved unit of work under tasks.completed / failed / cancelled.
void record_outcome(obs::Metrics& metrics, const CallError* error);

template <typename T>
void resolve(obs::Metrics& metrics, sync::OneshotSender<CallResult<T>>& sender, CallResult<T>&& result) {
  record_outcome(metrics, result ? nullptr : &result.error());
  sender.send(std::move(result));
}

template <typename T, typename F>
Async<void> run_task(AsyncFrame& frame, F body, sync::OneshotSender<CallResult<TaskValue<T>>> sender,
                     std::shared_ptr<obs::Metrics> metrics) {
  CallResult<TaskValue<T>> out = std::unexpected(CallError::closed());
  try {
    if constexpr (std::is_void_v<T>) {
      co_await body(frame);
      out = CallResult<void>();
    } else {
      out = TaskResult<T>::flatten(CallResult<T>(std::in_place, co_await body(frame)));
    }
  } catch (...) {
    out = std::unexpected(CallError::from_host(std::current_exception()));
  }
  resolve(*metrics, sender, std::move(out));
}

} // namespace detail

// Wrap a task body into a message plus the handle that receives its result.
template <typename F>
auto make_task(F body, std::shared_ptr<obs::Metrics> metrics)
    -> std::pair<TaskMessage, JoinHandle<TaskValue<TaskBodyValue<F>>>> {
  using T = TaskBodyValue<F>;
  auto [tx, rx] = sync::oneshot<CallResult<TaskValue<T>>>();
  CancellationToken token;
  TaskMessage msg{
      [body = std::move(body), tx = std::move(tx), metrics = std::move(metrics)](AsyncFrame& frame) mutable {
        return detail::run_task<T>(frame, std::move(body), std::move(tx), std::move(metrics));
      },
      token};
  return {std::move(msg), JoinHandle<TaskValue<T>>(std::move(rx), std::move(token))};
}

// Wrap a blocking body F(GcFrame&) -> T into a message plus its result handle.
template <typename F>
auto make_blocking_task(F body, std::shared_ptr<obs::Metrics> metrics)
    -> std::pair<BlockingTaskMessage, JoinHandle<TaskValue<std::invoke_result_t<F&, memory::GcFrame&>>>> {
  using T = std::invoke_result_t<F&, memory::GcFrame&>;
  auto [tx, rx] = sync::oneshot<CallResult<TaskValue<T>>>();
  BlockingTaskMessage msg{
      [body = std::move(body), tx = std::move(tx), metrics = std::move(metrics)](memory::GcFrame& frame) mutable {
        detail::resolve(*metrics, tx, TaskResult<T>::flatten(invoke_foreign([&] { return body(frame); })));
      }};
  return {std::move(msg), JoinHandle<TaskValue<T>>(std::move(rx), CancellationToken{})};
}

} // namespace tether::handle
