#pragma once

#include "ast/Stmt.h"
#include "ast/InterpolatedText.h"

namespace spindle::ast {
    struct CommandStmt final : Stmt {
        InterpolatedText text;
        CommandStmt() : Stmt(NodeKind::CommandStmt) {}
    };
} // namespace spindle::ast
