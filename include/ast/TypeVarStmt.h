#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pytdc::ast {

    // NAME = TypeVar('NAME', constraint..., keyword=value...)
    struct TypeVarStmt final : Stmt, KindOf<NodeKind::TypeVarStmt> {
        std::string name;
        std::string declaredName; // the string literal argument
        std::vector<std::unique_ptr<Expr>> constraints;
        std::vector<std::pair<std::string, std::unique_ptr<Expr>>> keywords;
        TypeVarStmt(std::string n, std::string declared)
            : Stmt(NodeKind::TypeVarStmt), name(std::move(n)), declaredName(std::move(declared)) {}
    };
} // namespace pytdc::ast
