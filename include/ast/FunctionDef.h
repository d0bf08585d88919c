#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Expr.h"
#include "ast/Name.h"
#include "ast/Param.h"
#include "ast/Stmt.h"

namespace pytdc::ast {
    // `name := type` inside a def body
    struct MutatorDecl {
        std::string name;
        std::unique_ptr<Expr> type;
    };

    struct FunctionDef final : Stmt, KindOf<NodeKind::FunctionDef> {
        std::string name;
        std::vector<Param> params;
        std::vector<std::unique_ptr<Name>> decorators; // @name or @name.attr
        std::unique_ptr<Expr> returnType{};            // null when omitted
        std::vector<std::unique_ptr<Expr>> raises;     // raise T / raise T()
        std::vector<MutatorDecl> mutators;
        bool external{false};                          // def NAME PYTHONCODE
        explicit FunctionDef(std::string n)
            : Stmt(NodeKind::FunctionDef), name(std::move(n)) {}
    };

} // namespace pytdc::ast
