#include "cli/ParseArgsInternals.h"

namespace pytdc::cli::detail {
    /***
     * Name: pytdc::cli::detail::isUnknownOptionArg
     * Purpose: Reject leftover '-' arguments; "-" by itself names stdin.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg.front() == '-';
    }
} // namespace pytdc::cli::detail
