#include "cli/ParseArgsInternals.h"

namespace pytdc::cli::detail {
    /***
     * Name: pytdc::cli::detail::hasConflictingOutputs
     * Purpose: A single -o file cannot hold the output of several inputs.
     */
    bool hasConflictingOutputs(const Options &opts) {
        return !opts.outputFile.empty() && opts.inputs.size() > 1;
    }
} // namespace pytdc::cli::detail
