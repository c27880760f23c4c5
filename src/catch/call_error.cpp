/***
 * Name: tether::CallError
 * Purpose: Construction, classification and rethrow of call errors.
 */
#include "tether/catch/CallResult.h"
#include "tether/catch/Catch.h"
#include "tether/exceptions/foreign_exception.h"
#include "tether/exceptions/invalid_handle_state.h"
#include "tether/exceptions/task_cancelled.h"
#include "tether/runtime/Unwind.h"
#include "tether/runtime/c_api.h"

#include <exception>
#include <string>
#include <utility>

namespace tether {

namespace detail {

std::string take_exception_message(void* exc) {
  std::string msg;
  if (exc != nullptr) {
    void* text = tether_rt_render(exc);
    msg.assign(tether_rt_string_data(text), tether_rt_string_len(text));
  }
  tether_rt_clear_exception();
  if (msg.empty()) { msg = "unknown foreign exception"; }
  return msg;
}

} // namespace detail

CallError CallError::exception(std::string message) {
  return CallError{Kind::Exception, std::move(message), nullptr};
}

CallError CallError::cancelled() { return CallError{Kind::Cancelled, "task cancelled", nullptr}; }

CallError CallError::closed() { return CallError{Kind::Closed, "handle closed before the work ran", nullptr}; }

CallError CallError::from_host(std::exception_ptr error) {
  if (!error) { return CallError{Kind::Panic, "unknown host exception", nullptr}; }
  try {
    std::rethrow_exception(error);
  } catch (const exceptions::TaskCancelled&) {
    return cancelled();
  } catch (const exceptions::ForeignException& e) {
    return exception(e.what());
  } catch (const rt::ForeignUnwind&) {
    return exception(detail::take_exception_message(tether_rt_current_exception()));
  } catch (const std::exception& e) {
    return CallError{Kind::Panic, e.what(), error};
  } catch (...) {
    return CallError{Kind::Panic, "unknown host exception", error};
  }
}

void CallError::rethrow() const {
  switch (kind) {
    case Kind::Panic:
      if (panic) { std::rethrow_exception(panic); }
      throw exceptions::InvalidHandleState("panic without a captured host exception: " + message);
    case Kind::Exception:
      throw exceptions::ForeignException(message);
    case Kind::Cancelled:
      throw exceptions::TaskCancelled(message);
    case Kind::Closed:
      throw exceptions::InvalidHandleState(message);
  }
  throw exceptions::InvalidHandleState(message);
}

const char* to_string(CallError::Kind kind) {
  switch (kind) {
    case CallError::Kind::Exception: return "Exception";
    case CallError::Kind::Panic: return "Panic";
    case CallError::Kind::Cancelled: return "Cancelled";
    case CallError::Kind::Closed: return "Closed";
  }
  return "Unknown";
}

} // namespace tether
