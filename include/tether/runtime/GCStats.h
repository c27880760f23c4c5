/***
 * Name: tether::rt::RuntimeStats
 * Purpose: Expose GC counters to tests, handles and tooling.
 */
#pragma once

#include <cstdint>

namespace tether::rt {
    struct RuntimeStats {
        uint64_t numAllocated{0};
        uint64_t numFreed{0};
        uint64_t numCollections{0};
        uint64_t numYoungCollections{0};
        uint64_t bytesAllocated{0};
        uint64_t bytesLive{0};
        uint64_t peakBytesLive{0};
        uint64_t lastReclaimedBytes{0};
    };
} // namespace tether::rt
