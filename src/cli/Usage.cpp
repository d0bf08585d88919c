#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pytdc::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(pytdc [options] file...

Parse pytd stub files and print them in canonical form. A file of '-'
reads standard input.

Options:
  -h, --help                Print this help and exit
  -o <file>                 Write the output to <file> (default: stdout)
  --name=<module>           Module name; qualifies all top-level names
                            (default: md5 of the source)
  --python-version=<a.b.c>  Target version for conditions (default: 2.7.6)
  --platform=<name>         Target platform for conditions (default: linux)
  --metrics                 Print stage timings to stderr
  --metrics-json            Print stage timings as JSON to stderr
  --dump-ast                Print the raw declaration tree before building
  --                        End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pytdc::cli
