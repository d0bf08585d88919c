#pragma once

#include <memory>
#include <utility>
#include "Expr.h"
#include "Stmt.h"

namespace pytdc::ast {
    // An `elif` is a nested IfStmt that is the sole element of elseBody.
    struct IfStmt final : Stmt, KindOf<NodeKind::IfStmt> {
        std::unique_ptr<Expr> cond;
        StmtList thenBody;
        StmtList elseBody;
        bool isElif{false};
        explicit IfStmt(std::unique_ptr<Expr> c) : Stmt(NodeKind::IfStmt), cond(std::move(c)) {}
    };
} // namespace pytdc::ast
