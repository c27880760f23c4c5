/***
 * Name: tether::rt (thread registration and GC states)
 * Purpose: Register host threads as mutators and move them between GC-safe and GC-unsafe states.
 * Theory of Operation:
 *   A registered (adopted) thread starts in the Unsafe state and may touch the heap.
 *   Before blocking it enters the Safe state so a collection can proceed without it;
 *   leaving the Safe state waits for any collection in progress. Allocation and
 *   safepoint() poll for pending collections. A root scanner callback lets the
 *   collector enumerate the host-side shadow stacks owned by the thread.
 */
#pragma once

#include <cstddef>
#include <cstdint>

namespace tether::rt {
    enum class GcState : int8_t {
        Unsafe = 0,
        Safe = 1
    };

    using RootVisitor = void (*)(void *object, void *visitCtx);
    using RootScanner = void (*)(void *ctx, RootVisitor visit, void *visitCtx);

    // Returns 0 on success, 1 if the thread is already adopted, 2 if the runtime is not running.
    int adopt_thread();

    void release_thread();

    bool is_adopted();

    // Replace the calling thread's scanner; nullptr clears it.
    void set_root_scanner(RootScanner scanner, void *ctx);

    GcState gc_safe_enter();

    void gc_safe_leave(GcState previous);

    GcState gc_unsafe_enter();

    void gc_unsafe_leave(GcState previous);

    GcState gc_state();

    void safepoint();

    // Number of adopted threads.
    std::size_t n_threads();
} // namespace tether::rt
