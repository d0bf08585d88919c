/**
 * @file
 * @brief AST name node declarations.
 */
#pragma once
#include <string>
#include <utility>
#include "Expr.h"

namespace pytdc::ast {

    // A possibly dotted name, e.g. `int` or `foo.bar.Baz`
    struct Name final : Expr, KindOf<NodeKind::Name> {
        std::string id;
        explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}
    };

} // namespace pytdc::ast
