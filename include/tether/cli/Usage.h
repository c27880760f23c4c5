#pragma once

#include <string>

namespace tether::cli {

    // Help text printed for -h/--help and after argument errors.
    std::string Usage();

} // namespace tether::cli
