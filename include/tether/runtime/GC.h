/***
 * Name: GC controls API
 * Purpose: Configure and drive the garbage collector; access stats.
 * Theory of Operation:
 *   Collections are stop-the-world. The collecting thread waits until every other
 *   registered mutator is in the GC-safe state, then marks from the runtime roots,
 *   each thread's exception slot and evaluation roots, and each thread's root scanner.
 *   Incremental collections only trace young objects plus the remembered set; every
 *   survivor of any collection is promoted to the old generation.
 */
#pragma once

#include <cstddef>
#include "tether/runtime/GCStats.h"

namespace tether::rt {
    enum class GcMode : int {
        Auto = 0,        // collect only when live bytes exceed the trigger
        Full = 1,        // trace and sweep both generations
        Incremental = 2  // young generation only
    };

    void gc_collect(GcMode mode);

    // Returns the previous setting. While disabled gc_collect() is a no-op.
    bool gc_enable(bool enabled);

    bool gc_is_enabled();

    void gc_set_threshold(std::size_t bytes);

    std::size_t gc_threshold();

    // Record a store of `child` into `owner`. Needed when owner may be old and child young.
    void gc_write_barrier(void *owner, void *child);

    RuntimeStats gc_stats();

    // Number of objects currently on the heap (live or not yet swept).
    std::size_t gc_object_count();
} // namespace tether::rt
