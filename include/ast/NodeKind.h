#pragma once

namespace pytdc::ast {
    enum class NodeKind {
        Module,
        FunctionDef,
        ClassDef,
        IfStmt,
        AssignStmt,
        TypeVarStmt,
        Import,
        ImportFrom,
        Name,
        IntLiteral,
        FloatLiteral,
        StringLiteral,
        BoolLiteral,
        EllipsisLiteral,
        QuestionType,
        TupleLiteral,
        ListLiteral,
        Subscript,
        Slice,
        OrExpr,
        Compare,
        NamedTupleExpr
    };

    const char* to_string(NodeKind k);
} // namespace pytdc::ast
