#pragma once

#include <memory>
#include <string>
#include "ast/Stmt.h"
#include "ast/Expr.h"

namespace spindle::ast {
    struct SetStmt final : Stmt {
        std::string variable;
        std::unique_ptr<Expr> value;
        SetStmt(std::string var, std::unique_ptr<Expr> v)
            : Stmt(NodeKind::SetStmt), variable(std::move(var)), value(std::move(v)) {}
    };
} // namespace spindle::ast
