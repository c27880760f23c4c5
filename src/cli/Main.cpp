#include "tether/cli/ParseArgs.h"
#include "tether/cli/Runner.h"
#include "tether/cli/Usage.h"
#include "tether/exceptions/tether_exception.h"
#include <exception>
#include <iostream>
/***
 * Name: tether-run main
 * Purpose: CLI entry point for running foreign source files and expressions.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status
 * Theory of Operation:
 *   Parse args then invoke cli::Run.
 */
int main(const int argc, char** argv) {
  try {
    tether::cli::Options opts;
    if (!tether::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << tether::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << tether::cli::Usage();
      return 0;
    }
    return tether::cli::Run(opts, std::cout, std::cerr);
  } catch (const tether::exceptions::TetherException& e) {
    std::cerr << "tether-run: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "tether-run: unhandled exception: " << e.what() << "\n";
    return 1;
  }
}
