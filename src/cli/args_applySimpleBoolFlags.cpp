#include "cli/ParseArgsInternals.h"

#include <array>

namespace pytdc::cli::detail {
    namespace {
    struct BoolFlag {
        std::string_view shortName;
        std::string_view longName;
        bool Options::*field;
    };

    constexpr std::array<BoolFlag, 4> kBoolFlags{{
        {"-h", "--help", &Options::showHelp},
        {"", "--metrics", &Options::metrics},
        {"", "--metrics-json", &Options::metricsJson},
        {"", "--dump-ast", &Options::dumpAst},
    }};
    } // namespace

    /***
     * Name: pytdc::cli::detail::applySimpleBoolFlags
     * Purpose: Set the Options field named by a flag-only argument.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (arg.empty()) { return false; }
        for (const auto &flag : kBoolFlags) {
            if (matchesAny(arg, {flag.shortName, flag.longName})) {
                out.*flag.field = true;
                return true;
            }
        }
        return false;
    }
} // namespace pytdc::cli::detail
