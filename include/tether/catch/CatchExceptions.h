/***
 * Name: tether::catch_exceptions
 * Purpose: Host-level try/catch around runtime calls with the caught exception rooted.
 * Inputs: A frame to root the exception in, the guarded callable, a handler
 * Outputs: The callable's result, the handler's result, or a Panic CallError
 * Theory of Operation:
 *   Same boundary as invoke_foreign, but a foreign exception is rooted in `frame` and handed
 *   to `handler(Value)` instead of being rendered. The handler's return type must match the
 *   callable's. The frame must be the top of its stack when an exception is caught; if
 *   rooting fails (StackOverflow, InvalidHandleState) that error propagates and the thread's
 *   exception slot is already clear.
 */
#pragma once

#include <functional>
#include <type_traits>
#include <utility>

#include "tether/catch/Catch.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Value.h"
#include "tether/runtime/c_api.h"

namespace tether {

template <typename F, typename H>
auto catch_exceptions(memory::Frame& frame, F&& func, H&& handler) -> CallResult<std::invoke_result_t<F&>> {
  using R = std::invoke_result_t<F&>;
  static_assert(std::is_convertible_v<std::invoke_result_t<H&, Value>, R> || std::is_void_v<R>,
                "handler must return the guarded callable's result type");
  using Tramp = detail::Trampoline<R, std::remove_reference_t<F>>;
  Tramp tramp{&func};
  const tether_catch_t caught = tether_rt_try_catch(&tramp, &Tramp::call, nullptr);
  if (caught.tag == TETHER_CATCH_PANIC) {
    return std::unexpected(CallError::from_host(tramp.panic));
  }
  if (caught.tag == TETHER_CATCH_EXCEPTION) {
    // Cleared before rooting; nothing allocates in between.
    tether_rt_clear_exception();
    const Value exc = frame.root(caught.error);
    if constexpr (std::is_void_v<R>) {
      std::invoke(handler, exc);
      return {};
    } else {
      return CallResult<R>(std::in_place, std::invoke(handler, exc));
    }
  }
  if constexpr (std::is_void_v<R>) {
    return {};
  } else {
    return CallResult<R>(std::in_place, std::move(*tramp.result));
  }
}

} // namespace tether
