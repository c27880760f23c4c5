#include "tether/cli/ParseArgsInternals.h"

namespace tether::cli::detail {
    /***
     * Name: tether::cli::detail::isUnknownOptionArg
     * Purpose: Anything left that starts with '-' is an option this tool does not know.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg[0] == '-';
    }
} // namespace tether::cli::detail
