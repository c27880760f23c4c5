#include "tether/cli/ParseArgsInternals.h"

namespace tether::cli::detail {
    /***
     * Name: tether::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options (workers, capacity, color).
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view workersPrefix{"--workers="}; arg.rfind(workersPrefix, 0) == 0) {
            out.nWorkers = parseCountValue("--workers", arg.substr(workersPrefix.size()));
            return true;
        }

        if (constexpr std::string_view capacityPrefix{"--capacity="}; arg.rfind(capacityPrefix, 0) == 0) {
            out.channelCapacity = parseCountValue("--capacity", arg.substr(capacityPrefix.size()));
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }
        return false;
    }
} // namespace tether::cli::detail
