#include "tool/Tool.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "pytdc/exceptions/usage_error.h"
#include <exception>
#include <iostream>
/***
 * Name: pytdc::main
 * Purpose: CLI entry point for the pytdc stub parser.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status: 0 success, 1 read/parse failure, 2 usage error
 * Theory of Operation:
 *   Parse args then invoke Tool::run.
 */
int main(const int argc, char** argv) {
  try {
    pytdc::cli::Options opts;
    if (!pytdc::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "pytdc: argument parse error\n";
      std::cerr << pytdc::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << pytdc::cli::Usage();
      return 0;
    }
    return pytdc::Tool::run(opts);
  } catch (const pytdc::exceptions::UsageError& ex) {
    std::cerr << "pytdc: " << ex.what() << "\n";
    std::cerr << pytdc::cli::Usage();
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "pytdc: " << ex.what() << "\n";
    return 1;
  }
}
