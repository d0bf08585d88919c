#pragma once

#include <string>

namespace pytdc::cli {

    // Help text printed for -h/--help and after usage errors
    std::string Usage();

} // namespace pytdc::cli
