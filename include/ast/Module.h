/**
 * @file
 * @brief Root of the raw declaration tree for one source.
 */
#pragma once

#include "ast/Stmt.h"

namespace pytdc::ast {
    struct Module final : Node, KindOf<NodeKind::Module> {
        StmtList body;
        Module() : Node(NodeKind::Module) {}
    };
} // namespace pytdc::ast
