#include "tether/cli/ParseArgsInternals.h"

namespace tether::cli::detail {
    /***
     * Name: tether::cli::detail::hasConflictingModes
     * Purpose: Only one metrics format may be requested.
     */
    bool hasConflictingModes(const Options &opts) {
        return opts.metrics && opts.metricsJson;
    }
} // namespace tether::cli::detail
