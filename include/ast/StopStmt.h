#pragma once

#include "ast/Stmt.h"

namespace spindle::ast {
    struct StopStmt final : Stmt {
        StopStmt() : Stmt(NodeKind::StopStmt) {}
    };
} // namespace spindle::ast
