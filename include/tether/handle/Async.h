/***
 * Name: tether::handle::Async<T>, AsyncFrame
 * Purpose: Cooperative tasks for the async runtime threads.
 * Inputs: Coroutine bodies written as `Async<T> body(AsyncFrame& frame)`
 * Outputs: The task's value (or its exception) to whoever awaits it
 * Theory of Operation:
 *   Async<T> is a lazily started coroutine. Awaiting one from another Async transfers control
 *   to it directly and returns to the awaiter when it finishes.
 *
 *   AsyncFrame is the task's base frame, a GcFrame on the stack reserved for the task, so
 *   values rooted in it survive suspension. `co_await frame.yield_now()` suspends the task
 *   at a runtime safepoint; the runtime thread records the suspended coroutine as the resume
 *   point and resumes it on a later turn, always on the same thread. `co_await
 *   frame.checkpoint()` does the same and then throws TaskCancelled if the token is set.
 *
 *   Frames opened inside a task and kept across a co_await must be on the task's own stack
 *   (frame.scope(...) and friends), never on another task's or handle's stack.
 *
 *   `co_await frame.async_scope(body)` pushes a child AsyncFrame on the task's stack, awaits
 *   body(child) and pops the child when the body finishes. The child may suspend; values
 *   rooted in it stay valid across every co_await inside the body. Results that must outlive
 *   the child go through an Output reserved in the parent (frame.output()).
 */
#pragma once

#include <coroutine>
#include <cstddef>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include "tether/exceptions/task_cancelled.h"
#include "tether/handle/CancellationToken.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Target.h"
#include "tether/memory/Value.h"
#include "tether/runtime/c_api.h"

namespace tether::handle {

namespace detail {

struct PromiseBase {
  std::coroutine_handle<> continuation{};
  std::exception_ptr error{};

  struct FinalAwaiter {
    bool await_ready() const noexcept { return false; }
    template <typename P>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<P> self) noexcept {
      std::coroutine_handle<> next = self.promise().continuation;
      if (next) { return next; }
      return std::noop_coroutine();
    }
    void await_resume() const noexcept {}
  };

  std::suspend_always initial_suspend() const noexcept { return {}; }
  FinalAwaiter final_suspend() const noexcept { return {}; }
  void unhandled_exception() noexcept { error = std::current_exception(); }
};

template <typename T>
struct ValuePromise : PromiseBase {
  std::optional<T> value;

  template <typename U>
  void return_value(U&& result) { value.emplace(std::forward<U>(result)); }

  T take() { return std::move(*value); }
};

template <>
struct ValuePromise<void> : PromiseBase {
  void return_void() const noexcept {}
  void take() const noexcept {}
};

} // namespace detail

template <typename T = void>
class [[nodiscard]] Async {
 public:
  using value_type = T;

  struct promise_type : detail::ValuePromise<T> {
    Async get_return_object() { return Async(std::coroutine_handle<promise_type>::from_promise(*this)); }
  };

  Async(Async&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}
  Async& operator=(Async&& other) noexcept {
    if (this != &other) {
      reset();
      handle_ = std::exchange(other.handle_, {});
    }
    return *this;
  }
  Async(const Async&) = delete;
  Async& operator=(const Async&) = delete;
  ~Async() { reset(); }

  std::coroutine_handle<promise_type> handle() const noexcept { return handle_; }
  bool done() const noexcept { return !handle_ || handle_.done(); }

  // Rethrows what the body threw, or returns what it returned. Valid once done().
  T result() {
    if (handle_.promise().error) { std::rethrow_exception(handle_.promise().error); }
    return handle_.promise().take();
  }

  bool await_ready() const noexcept { return false; }
  std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
    handle_.promise().continuation = awaiting;
    return handle_;
  }
  T await_resume() { return result(); }

 private:
  explicit Async(std::coroutine_handle<promise_type> handle) noexcept : handle_(handle) {}

  void reset() noexcept {
    if (handle_) { handle_.destroy(); }
    handle_ = {};
  }

  std::coroutine_handle<promise_type> handle_;
};

template <typename T>
struct AsyncValue;

template <typename T>
struct AsyncValue<Async<T>> {
  using type = T;
};

class AsyncFrame : public memory::Target {
 public:
  AsyncFrame(memory::Stack& stack, CancellationToken token)
      : base_(stack), token_(std::move(token)), owner_(this) {}
  AsyncFrame(const AsyncFrame&) = delete;
  AsyncFrame& operator=(const AsyncFrame&) = delete;

  Value root(void* obj) override { return base_.root(obj); }

  memory::Output output() { return base_.output(); }
  memory::ReusableSlot reusable_slot() { return base_.reusable_slot(); }

  memory::GcFrame& base() noexcept { return base_; }
  memory::Stack& stack() noexcept { return base_.stack(); }
  const CancellationToken& token() const noexcept { return token_; }

  template <typename F>
  auto scope(F&& func) { return base_.scope(std::forward<F>(func)); }

  template <std::size_t N, typename F>
  auto local_scope(F&& func) { return base_.local_scope<N>(std::forward<F>(func)); }

  template <typename F>
  auto unsized_local_scope(std::size_t size, F&& func) {
    return base_.unsized_local_scope(size, std::forward<F>(func));
  }

  template <typename F>
  auto async_scope(F body) -> Async<typename AsyncValue<std::invoke_result_t<F&, AsyncFrame&>>::type> {
    AsyncFrame child(*this, ChildTag{});
    co_return co_await body(child);
  }

  struct YieldAwaiter {
    AsyncFrame* frame;
    bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<> self) const noexcept {
      frame->owner_->resumePoint_ = self;
      tether_rt_safepoint();
    }
    void await_resume() const noexcept {}
  };

  struct CheckpointAwaiter {
    AsyncFrame* frame;
    CancellationToken token;
    bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<> self) const noexcept {
      frame->owner_->resumePoint_ = self;
      tether_rt_safepoint();
    }
    void await_resume() const {
      if (token.is_cancelled()) { throw exceptions::TaskCancelled("task cancelled"); }
    }
  };

  YieldAwaiter yield_now() noexcept { return YieldAwaiter{this}; }
  CheckpointAwaiter checkpoint() { return CheckpointAwaiter{this, token_}; }
  CheckpointAwaiter checkpoint(const CancellationToken& token) { return CheckpointAwaiter{this, token}; }

  // Child frames report to the task's base frame.
  std::coroutine_handle<> resume_point() const noexcept { return owner_->resumePoint_; }
  void set_resume_point(std::coroutine_handle<> point) noexcept { owner_->resumePoint_ = point; }
  bool is_child() const noexcept { return owner_ != this; }

 private:
  struct ChildTag {};

  AsyncFrame(AsyncFrame& parent, ChildTag /*tag*/)
      : base_(parent.stack()), token_(parent.token_), owner_(parent.owner_) {}

  memory::GcFrame base_;
  CancellationToken token_;
  AsyncFrame* owner_;
  std::coroutine_handle<> resumePoint_{};
};

} // namespace tether::handle
