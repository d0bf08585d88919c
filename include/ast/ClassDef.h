#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pytdc::ast {
    // One class argument in source order; keyword is empty for a parent
    struct ClassArg {
        std::string keyword;
        std::unique_ptr<Expr> value;
    };

    struct ClassDef final : Stmt, KindOf<NodeKind::ClassDef> {
        std::string name;
        std::vector<ClassArg> args;
        StmtList body;
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), name(std::move(n)) {}
    };
}
