/***
 * Name: tether::cli::Run
 * Purpose: Execute a tether-run invocation against an async runtime.
 * Inputs: Parsed Options; output and error streams
 * Outputs: Exit status (0 success, 1 foreign or include error, 2 usage error)
 * Theory of Operation:
 *   Starts an async runtime with the requested workers and queue capacity, applies the color
 *   setting, includes each input file, then evaluates each expression in a blocking task and
 *   prints its rendered value. The first failure is reported on the error stream and stops
 *   the run. Metrics combine the runtime's task counters, collector statistics (gc.*) and the
 *   run's phase timings.
 */
#pragma once

#include <ostream>

#include "tether/cli/Options.h"

namespace tether::cli {

    int Run(const Options& opts, std::ostream& out, std::ostream& err);

    // ColorMode::Auto resolves through TETHER_COLOR (1/true/yes), then whether stderr is a tty.
    bool ResolveColor(ColorMode mode);

} // namespace tether::cli
