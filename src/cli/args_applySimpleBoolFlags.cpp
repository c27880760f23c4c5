#include "tether/cli/ParseArgsInternals.h"

namespace tether::cli::detail {
    /***
     * Name: tether::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "--help", "-h")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        return false;
    }
} // namespace tether::cli::detail
