#pragma once

#include <memory>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Expr.h"

namespace spindle::ast {
    // One `<<if>>` / `<<elseif>>` / `<<else>>` arm; `cond` is null for else.
    struct IfClause {
        std::unique_ptr<Expr> cond;
        Body body;
    };

    struct IfStmt final : Stmt {
        std::vector<IfClause> clauses;
        IfStmt() : Stmt(NodeKind::IfStmt) {}
    };
} // namespace spindle::ast
