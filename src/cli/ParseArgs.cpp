#include "tether/cli/ParseArgs.h"
#include "tether/cli/ColorMode.h"
#include "tether/cli/Options.h"
#include "tether/cli/ParseArgsInternals.h"
#include "tether/exceptions/config_error.h"
#include <cstddef>
#include <iostream>
#include <span>

namespace tether::cli {
    /***
     * Name: tether::cli::ParseArgs
     * Purpose: Argument parser for tether-run.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        try {
            for (int i = 1; i < argc; ++i) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                const std::string_view arg{argv[i]};
                if (detail::isFlag(arg, "--")) {
                    const std::span<char *const> all(argv, static_cast<std::size_t>(argc));
                    detail::collectRemainingAsInputs(all.subspan(static_cast<std::size_t>(i) + 1), out);
                    break;
                }
                if (detail::handleExpressionFlag(i, argc, argv, out)) { continue; }
                if (detail::applySimpleBoolFlags(arg, out)) { continue; }
                if (detail::applyPrefixedOptions(arg, out)) { continue; }

                // Positional
                if (detail::isUnknownOptionArg(arg)) {
                    std::cerr << "tether-run: unknown option '" << arg << "'\n";
                    return false;
                }
                out.inputs.emplace_back(std::string(arg));
            }
        } catch (const exceptions::ConfigError &e) {
            std::cerr << "tether-run: " << e.what() << "\n";
            return false;
        }

        if (detail::hasConflictingModes(out)) {
            std::cerr << "tether-run: cannot use --metrics and --metrics-json together\n";
            return false;
        }

        return true;
    }
} // namespace tether::cli
