#pragma once

#include "Options.h"

namespace pytdc::cli {

    // Parse argv into Options. Returns false on fatal parse error; an
    // unparsable option value throws exceptions::UsageError.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace pytdc::cli
