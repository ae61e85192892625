#pragma once

namespace spindle::ast {
    enum class NodeKind {
        File,
        NodeDecl,
        // statements
        LineStmt,
        OptionGroup,
        OptionItem,
        SetStmt,
        DeclareStmt,
        IfStmt,
        JumpStmt,
        StopStmt,
        CommandStmt,
        // expressions
        NumberLiteral,
        StringLiteral,
        BoolLiteral,
        VariableRef,
        Call,
        UnaryExpr,
        BinaryExpr
    };

    const char* to_string(NodeKind k);
} // namespace spindle::ast
