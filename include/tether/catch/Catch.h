/***
 * Name: tether catch boundary
 * Purpose: Run host code that calls into the runtime and turn whatever escapes into values.
 * Inputs: A callable; optionally a frame and an exception handler
 * Outputs: CallResult of the callable's return type
 * Theory of Operation:
 *   The callable runs inside tether_rt_try_catch through a trampoline. A foreign raise
 *   unwinds to try_catch and comes back as the Exception tag; the exception object is still
 *   rooted in the thread's exception slot while it is rendered, then the slot is cleared.
 *   Host exceptions are captured by the trampoline as std::exception_ptr and reported with
 *   the Panic tag; they never unwind through the runtime's frames.
 */
#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "tether/catch/CallResult.h"
#include "tether/runtime/Unwind.h"
#include "tether/runtime/c_api.h"

namespace tether {
namespace detail {

template <typename R, typename F>
struct Trampoline {
  using Stored = std::conditional_t<std::is_void_v<R>, std::monostate, R>;

  F* func;
  std::optional<Stored> result{};
  std::exception_ptr panic{};

  static int call(void* callback, void* /*result*/) {
    auto* self = static_cast<Trampoline*>(callback);
    try {
      if constexpr (std::is_void_v<R>) {
        std::invoke(*self->func);
        self->result.emplace();
      } else {
        self->result.emplace(std::invoke(*self->func));
      }
      return 0;
    } catch (const rt::ForeignUnwind&) {
      throw;
    } catch (...) {
      self->panic = std::current_exception();
      return 1;
    }
  }
};

// Render the exception object for a CallError and clear the thread's exception slot.
std::string take_exception_message(void* exc);

} // namespace detail

template <typename F>
auto invoke_foreign(F&& func) -> CallResult<std::invoke_result_t<F&>> {
  using R = std::invoke_result_t<F&>;
  using Tramp = detail::Trampoline<R, std::remove_reference_t<F>>;
  Tramp tramp{&func};
  const tether_catch_t caught = tether_rt_try_catch(&tramp, &Tramp::call, nullptr);
  if (caught.tag == TETHER_CATCH_EXCEPTION) {
    return std::unexpected(CallError::exception(detail::take_exception_message(caught.error)));
  }
  if (caught.tag == TETHER_CATCH_PANIC) {
    return std::unexpected(CallError::from_host(tramp.panic));
  }
  if constexpr (std::is_void_v<R>) {
    return {};
  } else {
    return CallResult<R>(std::in_place, std::move(*tramp.result));
  }
}

} // namespace tether
