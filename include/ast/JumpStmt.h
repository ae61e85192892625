#pragma once

#include <memory>
#include <string>
#include "ast/Stmt.h"
#include "ast/Expr.h"

namespace spindle::ast {
    // `<<jump Node>>` sets target; `<<jump {expr}>>` sets targetExpr.
    struct JumpStmt final : Stmt {
        std::string target;
        std::unique_ptr<Expr> targetExpr;
        JumpStmt() : Stmt(NodeKind::JumpStmt) {}
    };
} // namespace spindle::ast
