#include "tether/cli/Runner.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <unistd.h>

namespace tether::cli {
    static bool equals_ci(const std::string_view lhs, const std::string_view rhs) {
        if (lhs.size() != rhs.size()) { return false; }
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            const unsigned char lhsCh = static_cast<unsigned char>(lhs[i]);
            const unsigned char rhsCh = static_cast<unsigned char>(rhs[i]);
            if (std::tolower(lhsCh) != std::tolower(rhsCh)) { return false; }
        }
        return true;
    }

    static bool is_true_value(const char *strVal) {
        const std::string_view valView{strVal, std::strlen(strVal)};
        return valView == "1" || equals_ci(valView, "true") || equals_ci(valView, "yes");
    }

    /***
     * Name: tether::cli::ResolveColor
     * Purpose: Decide whether foreign errors are colored for this run.
     */
    bool ResolveColor(const ColorMode mode) {
        switch (mode) {
            case ColorMode::Always: return true;
            case ColorMode::Never: return false;
            case ColorMode::Auto: break;
        }
        if (const char *env_value = std::getenv("TETHER_COLOR"); env_value != nullptr) {
            return is_true_value(env_value);
        }
        return isatty(fileno(stderr)) != 0;
    }
} // namespace tether::cli
