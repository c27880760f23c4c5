#include "tether/cli/ParseArgsInternals.h"

namespace tether::cli::detail {

/***
 * Name: tether::cli::detail::isFlag
 * Purpose: Match one argv item against a long flag and, if given, its short alias.
 */
bool isFlag(const std::string_view arg, const std::string_view longName, const std::string_view shortName) {
  if (arg == longName) { return true; }
  return !shortName.empty() && arg == shortName;
}

} // namespace tether::cli::detail
