/**
 * @file
 * @brief AST variable reference (`$name`).
 */
#pragma once
#include <string>
#include "Expr.h"

namespace spindle::ast {

    struct VariableRef final : Expr {
        std::string name; // includes the leading '$'
        explicit VariableRef(std::string n) : Expr(NodeKind::VariableRef), name(std::move(n)) {}
    };

} // namespace spindle::ast
