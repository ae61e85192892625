#pragma once

#include <string>
#include <utility>
#include "ast/Expr.h"

namespace spindle::ast {

template <typename T, NodeKind K>
struct Literal final : Expr {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

using NumberLiteral = Literal<double, NodeKind::NumberLiteral>;
using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;

} // namespace spindle::ast
