#ifndef PYTDC_TOOL_TOOL_H
#define PYTDC_TOOL_TOOL_H

/***
 * Name: pytdc::Tool
 * Purpose: Drive the command-line tool over its input files.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Canonical stub text on stdout or in the -o file; exit code
 * Theory of Operation:
 *   Reads each input, optionally dumps its raw tree, parses it with the
 *   filename attached for diagnostics and prints the canonical module.
 *   The first failing input stops the run. Metrics from all inputs are
 *   accumulated into one summary written to stderr.
 */

#include <string>

// Forward declarations to reduce header coupling
namespace pytdc { namespace cli { struct Options; } }
namespace pytdc { struct ParseError; }

namespace pytdc {
    class Tool {
    public:
        // 0 on success, 1 on read/parse/write failure, 2 with no inputs.
        // Throws exceptions::FileReadError for unreadable inputs.
        static int run(const cli::Options &opts);

        static void print_error(const ParseError &err);

        static bool dump_ast(const std::string &source, const std::string &filename, std::string &out);
    };
} // namespace pytdc

#endif // PYTDC_TOOL_TOOL_H
