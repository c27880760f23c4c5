#include "tether/cli/ParseArgsInternals.h"
#include "tether/exceptions/config_error.h"
#include "tether/support/parse.h"

#include <cstddef>
#include <string>

namespace tether::cli::detail {

/***
 * Name: tether::cli::detail::parseCountValue
 * Purpose: Parse the numeric value of a count option such as --workers=<N>.
 */
std::size_t parseCountValue(std::string_view option, std::string_view value) {
    constexpr std::size_t kMaxCount = 1U << 16U;
    std::size_t count = 0;
    std::string err;
    if (!support::ParseCount(value, kMaxCount, count, &err)) {
        throw exceptions::ConfigError(std::string(option) + ": " + err + " '" + std::string(value) + "'");
    }
    return count;
}

} // namespace tether::cli::detail
