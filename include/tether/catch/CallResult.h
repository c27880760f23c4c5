/***
 * Name: tether::CallError, tether::CallResult
 * Purpose: Typed outcome of any operation that crosses into the runtime or runs a task.
 * Theory of Operation:
 *   - Exception: a foreign exception; message is the runtime's rendering, never empty.
 *   - Panic: a host exception escaped the callback; panic holds it for rethrow().
 *   - Cancelled: the task observed its cancellation token at a checkpoint.
 *   - Closed: the work was dropped because its handle closed before it ran.
 */
#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <string>

namespace tether {

struct CallError {
  enum class Kind : uint8_t { Exception, Panic, Cancelled, Closed };

  Kind kind{Kind::Exception};
  std::string message;
  std::exception_ptr panic;

  static CallError exception(std::string message);
  static CallError cancelled();
  static CallError closed();

  // Classify an exception that escaped host code: cancellation, a foreign unwind still in
  // flight, or a panic.
  static CallError from_host(std::exception_ptr error);

  bool is_exception() const noexcept { return kind == Kind::Exception; }
  bool is_panic() const noexcept { return kind == Kind::Panic; }
  bool is_cancelled() const noexcept { return kind == Kind::Cancelled; }
  bool is_closed() const noexcept { return kind == Kind::Closed; }

  // Panic: rethrows the original host exception. Exception: throws ForeignException.
  // Cancelled: throws TaskCancelled. Closed: throws InvalidHandleState.
  [[noreturn]] void rethrow() const;
};

const char* to_string(CallError::Kind kind);

template <typename T>
using CallResult = std::expected<T, CallError>;

} // namespace tether
