/**
 * @file
 * @brief Qualify top-level names with an explicitly given module name.
 */
#pragma once

#include <string>
#include "pytd/Decls.h"

namespace pytdc::sema::detail {

/**
 * Rename every top-level declaration `x` to `prefix.x` and rewrite each
 * NamedType that refers to a class of this module the same way.
 */
void applyNamePrefix(pytd::Module& module, const std::string& prefix);

} // namespace pytdc::sema::detail
