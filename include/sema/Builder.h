#pragma once

#include <memory>
#include <vector>
#include "ast/Nodes.h"
#include "pytd/Decls.h"
#include "sema/BuildContext.h"
#include "sema/SignatureBuilder.h"
#include "sema/TypeNormalizer.h"
#include "sema/detail/types/RawDef.h"

namespace pytdc::sema {
    /***
     * Name: pytdc::sema::Builder
     * Purpose: Turn the raw declaration tree into the canonical module.
     * Inputs:
     *   - Raw ast::Module and the per-call BuildContext
     * Outputs:
     *   - pytd::Module, or false with ctx.error set
     * Theory of Operation:
     *   1. Prescan: evaluate every reachable condition and register live
     *      classes and type variables.
     *   2. Build: walk live branches in source order, converting imports,
     *      assignments, type variables, classes and defs. Defs are collected
     *      per scope and merged when the scope closes, so overloads separated
     *      by other statements still fold together.
     *   3. Append the record classes synthesized during type conversion.
     *   Validation and name qualification run afterwards as separate stages.
     */
    class Builder {
    public:
        explicit Builder(BuildContext &ctx) : ctx_(ctx), types_(ctx), sigs_(ctx, types_) {}

        bool build(const ast::Module &raw, pytd::Module &out);

    private:
        using Body = ast::StmtList;

        BuildContext &ctx_;
        TypeNormalizer types_;
        SignatureBuilder sigs_;

        bool buildModuleBody(const Body &body, pytd::Module &out, std::vector<RawDef> &defs);
        bool buildClassBody(const Body &body, int classLine, pytd::Class &out, std::vector<RawDef> &defs);
        bool buildClass(const ast::ClassDef &cls, pytd::Module &out);
        bool buildClassArgs(const ast::ClassDef &cls, pytd::Class &out);
        bool buildDef(const ast::FunctionDef &def, std::vector<RawDef> &defs);
        bool buildModuleAssign(const ast::AssignStmt &stmt, pytd::Module &out);
        bool buildClassAssign(const ast::AssignStmt &stmt, int classLine, pytd::Class &out);
        bool buildImport(const ast::Import &stmt);
        bool buildImportFrom(const ast::ImportFrom &stmt, pytd::Module &out);
        bool buildTypeVar(const ast::TypeVarStmt &stmt, pytd::Module &out);
        // Constant type of `x = ...`, `x = 0`, `x: T` and friends; nullptr with
        // `handled` false when the value is not a constant form
        pytd::TypePtr constantType(const ast::AssignStmt &stmt, bool &handled);
        const Body &liveBranch(const ast::IfStmt &ifs) const;
    };
} // namespace pytdc::sema
