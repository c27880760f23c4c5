#pragma once

#include "tether/cli/ColorMode.h"
#include "tether/cli/Options.h"

namespace tether::cli {

    // Parse argv into Options. Returns false on fatal parse error.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace tether::cli
