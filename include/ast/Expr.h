/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "Node.h"
#include "runtime/ValueType.h"
#include <optional>

namespace spindle::ast {
    struct Expr : Node {
        using Node::Node;
        // Mutable so the type checker can annotate const trees; codegen reads
        // the annotation to pick the operator overload.
        mutable std::optional<rt::ValueType> annotatedType{};
        void setType(rt::ValueType t) const { annotatedType = t; }
        std::optional<rt::ValueType> type() const { return annotatedType; }
    };
} // namespace spindle::ast
