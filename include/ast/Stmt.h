/**
 * @file
 * @brief AST statement base declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Node.h"

namespace pytdc::ast {
    struct Stmt : Node {
        using Node::Node;
    };

    // Statements of a module, class or branch in source order
    using StmtList = std::vector<std::unique_ptr<Stmt>>;
} // namespace pytdc::ast
