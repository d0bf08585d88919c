/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "Node.h"

namespace pytdc::ast {
    // Expressions double as type expressions, condition operands and
    // parameter defaults; the raw tree keeps them unresolved.
    struct Expr : Node {
        using Node::Node;
    };
} // namespace pytdc::ast
