/**
 * @file
 * @brief Infix operator application. Lowered to a `<Type>.<Op>` library call
 *        chosen from the left operand's checked type.
 */
#pragma once
#include <memory>

#include "ast/BinaryOperator.h"
#include "ast/Expr.h"

namespace spindle::ast {
    struct Binary final : Expr {
        BinaryOperator op;
        std::unique_ptr<Expr> lhs;
        std::unique_ptr<Expr> rhs;

        Binary(const BinaryOperator o, std::unique_ptr<Expr> a, std::unique_ptr<Expr> b)
            : Expr(NodeKind::BinaryExpr), op(o), lhs(std::move(a)), rhs(std::move(b)) {}
    };
} // namespace spindle::ast
