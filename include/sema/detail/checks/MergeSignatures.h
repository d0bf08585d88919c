/**
 * @file
 * @brief Merge same-name definitions into functions and properties.
 */
#pragma once

#include <optional>
#include <vector>
#include "pytd/Decls.h"
#include "sema/BuildContext.h"
#include "sema/detail/types/RawDef.h"

namespace pytdc::sema::detail {

/**
 * Merge the definitions of one class body. Property families become
 * constants appended to `properties`; everything else becomes a method.
 * Errors are reported at `classLine`.
 */
bool mergeClassDefs(std::vector<RawDef> defs, int classLine, BuildContext& ctx,
                    std::vector<pytd::Function>& methods, std::vector<pytd::Constant>& properties);

/** Merge module-level definitions; any property decorator is an error. */
bool mergeModuleDefs(std::vector<RawDef> defs, BuildContext& ctx, std::vector<pytd::Function>& functions);

} // namespace pytdc::sema::detail
