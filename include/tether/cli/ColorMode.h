/***
 * Name: tether::cli::ColorMode
 * Purpose: Whether foreign error text is rendered with ANSI colors.
 */
#pragma once

#include <cstdint>

namespace tether::cli {

    enum class ColorMode : uint8_t {
        Auto,
        Always,
        Never
    };

} // namespace tether::cli
