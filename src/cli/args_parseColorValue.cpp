#include "tether/cli/ParseArgsInternals.h"

namespace tether::cli::detail {

/***
 * Name: tether::cli::detail::parseColorValue
 * Purpose: Map --color=always|never|auto; unknown values fall back to auto.
 */
ColorMode parseColorValue(std::string_view value) {
    using enum tether::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    return Auto;
}

} // namespace tether::cli::detail
