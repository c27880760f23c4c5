#include "tether/cli/ParseArgsInternals.h"

namespace tether::cli::detail {

// Everything after `--` is a script path, dashes included.
void collectRemainingAsInputs(const std::span<char* const> rest, Options& out) {
  out.inputs.insert(out.inputs.end(), rest.begin(), rest.end());
}

} // namespace tether::cli::detail
