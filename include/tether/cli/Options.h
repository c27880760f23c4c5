#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tether/cli/ColorMode.h"

namespace tether::cli {

    struct Options {
        bool showHelp{false};
        bool metrics{false};              // --metrics
        bool metricsJson{false};          // --metrics-json
        std::size_t nWorkers{0};          // --workers=<N>
        std::size_t channelCapacity{0};   // --capacity=<N> (0 = unbounded)
        ColorMode color{ColorMode::Auto}; // --color=<mode>
        std::vector<std::string> inputs{};      // files to include, in order
        std::vector<std::string> expressions{}; // -e <expr>, evaluated after the files
    };

} // namespace tether::cli
