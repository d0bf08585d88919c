#include "cli/ParseArgsInternals.h"

#include <algorithm>

namespace pytdc::cli::detail {
    /***
     * Name: pytdc::cli::detail::matchesAny
     * Purpose: Match a short/long pair such as -h/--help in one call.
     */
    bool matchesAny(const std::string_view arg, const std::initializer_list<std::string_view> spellings) {
        return std::find(spellings.begin(), spellings.end(), arg) != spellings.end();
    }
} // namespace pytdc::cli::detail
