/***
 * Name: pytdc::sema::TargetEnv
 * Purpose: The runtime version and platform conditions are evaluated against.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pytdc::sema {
    struct TargetEnv {
        std::vector<int64_t> version{2, 7, 6}; // padded to three elements when compared
        std::string platform{"linux"};
    };
} // namespace pytdc::sema
