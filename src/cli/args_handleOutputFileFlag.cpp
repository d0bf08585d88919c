#include "cli/ParseArgsInternals.h"

#include <string>

namespace pytdc::cli::detail {
    /***
     * Name: pytdc::cli::detail::handleOutputFileFlag
     * Purpose: Take the output path from `-o <file>` or `-o<file>`.
     */
    OutputFlag handleOutputFileFlag(int &idx, int argc, char **argv, Options &out) {
        constexpr std::string_view kFlag{"-o"};
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const std::string_view arg{argv[idx]};
        if (arg.rfind(kFlag, 0) != 0) { return OutputFlag::NotOutput; }
        if (arg.size() > kFlag.size()) {
            out.outputFile = std::string(arg.substr(kFlag.size()));
            return OutputFlag::Consumed;
        }
        if (idx + 1 >= argc) { return OutputFlag::MissingValue; }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.outputFile = argv[++idx];
        return OutputFlag::Consumed;
    }
} // namespace pytdc::cli::detail
