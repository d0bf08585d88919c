#include "cli/ParseArgs.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>

namespace pytdc::cli {
    /***
     * Name: pytdc::cli::ParseArgs
     * Purpose: GCC-like argument parser for pytdc.
     * Theory of Operation:
     *   Options and inputs may interleave. "--" ends option processing and
     *   everything after it is an input. Returns false after printing a
     *   diagnostic; a malformed --python-version throws UsageError.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        bool optionsDone = false;
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (optionsDone) {
                out.inputs.emplace_back(arg);
                continue;
            }
            if (detail::matchesAny(arg, {"--"})) {
                optionsDone = true;
                continue;
            }
            switch (detail::handleOutputFileFlag(i, argc, argv, out)) {
                case detail::OutputFlag::Consumed:
                    continue;
                case detail::OutputFlag::MissingValue:
                    std::cerr << "pytdc: missing filename after '-o'\n";
                    return false;
                case detail::OutputFlag::NotOutput:
                    break;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::applyPrefixedOptions(arg, out)) { continue; }

            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pytdc: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(arg);
        }

        if (detail::hasConflictingOutputs(out)) {
            std::cerr << "pytdc: cannot use -o with more than one input\n";
            return false;
        }

        return true;
    }
} // namespace pytdc::cli
