#include "tether/cli/Usage.h"
#include <string>
#include <string_view>
namespace tether::cli {

namespace {
constexpr std::string_view kUsageText = R"(tether-run [options] [file...]

Includes each file into a fresh runtime, then evaluates each -e expression and prints
its value.

Options:
  -h, --help           Print this help and exit
  -e <expr>            Evaluate <expr> after the files and print the result (repeatable)
  --workers=<N>        Worker threads besides the main runtime thread (default: 0)
  --capacity=<N>       Bound on each task queue; 0 is unbounded (default: 0)
  --color=<mode>       Color foreign errors: always|never|auto (default: auto)
  --metrics            Print task counters, collector statistics and timings
  --metrics-json       Print the same metrics as JSON
  --                   End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace tether::cli
