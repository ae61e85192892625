/**
 * @file
 * @brief `<<declare $var = value as Type>>`; either part may be absent.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include "ast/Stmt.h"
#include "ast/Expr.h"

namespace spindle::ast {
    struct DeclareStmt final : Stmt {
        std::string variable;
        std::unique_ptr<Expr> value;          // may be null
        std::optional<std::string> typeName;  // as written after `as`
        explicit DeclareStmt(std::string var) : Stmt(NodeKind::DeclareStmt), variable(std::move(var)) {}
    };
} // namespace spindle::ast
