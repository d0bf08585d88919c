#pragma once

#include <memory>
#include <string>
#include <utility>

#include "Expr.h"
#include "Stmt.h"

namespace pytdc::ast {

    // NAME = value [# type: T]  |  NAME : T [= value]
    struct AssignStmt final : Stmt, KindOf<NodeKind::AssignStmt> {
        std::string target;
        std::unique_ptr<Expr> value;       // null for a bare PEP 526 declaration
        std::unique_ptr<Expr> annotation;  // PEP 526 annotation
        std::unique_ptr<Expr> typeComment; // trailing or next-line `# type:`
        AssignStmt(std::string t, std::unique_ptr<Expr> v)
            : Stmt(NodeKind::AssignStmt), target(std::move(t)), value(std::move(v)) {}
    };
} // namespace pytdc::ast
