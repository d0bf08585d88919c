/**
 * @file
 * @brief Duplicate-name validation over the merged module.
 */
#pragma once

#include "pytd/Decls.h"
#include "sema/BuildContext.h"

namespace pytdc::sema::detail {

/**
 * Each top-level name (constant, function, class, alias, type variable)
 * must be unique, and so must each class's constant and method names.
 * Offending names are reported sorted and deduplicated.
 */
bool validateModule(const pytd::Module& module, BuildContext& ctx);

} // namespace pytdc::sema::detail
