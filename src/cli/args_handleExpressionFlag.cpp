#include "tether/cli/ParseArgsInternals.h"
#include "tether/exceptions/config_error.h"

namespace tether::cli::detail {
    /***
     * Name: tether::cli::detail::handleExpressionFlag
     * Purpose: Consume `-e <expr>`; the expression is the next argv item.
     */
    bool handleExpressionFlag(int &idx, const int argc, char **argv, Options &out) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (!isFlag(argv[idx], "-e")) { return false; }
        if (idx + 1 >= argc) { throw exceptions::ConfigError("-e requires an expression"); }
        ++idx;
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.expressions.emplace_back(argv[idx]);
        return true;
    }
} // namespace tether::cli::detail
