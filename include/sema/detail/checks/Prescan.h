/**
 * @file
 * @brief Evaluate conditions and register live class and type variable names.
 */
#pragma once

#include "ast/Module.h"
#include "sema/BuildContext.h"

namespace pytdc::sema::detail {

/**
 * Walk the raw tree once before building. Every reached if/elif condition
 * is evaluated against the target and its value stored in ctx.liveness;
 * only the live branch is descended. Classes and type variables met on the
 * way are registered so forward references resolve.
 */
bool prescanModule(const ast::Module& module, BuildContext& ctx);

} // namespace pytdc::sema::detail
