/***
 * Name: spindle::ast::Node
 * Purpose: Base of every syntax-tree node: its kind and where it was written.
 * Theory of Operation:
 *   accept() switches on `kind` (see ast/Visitor.h), so concrete nodes only
 *   need a constructor. Locations are 1-based; 0 means synthesized.
 */
#pragma once

#include "ast/NodeKind.h"
#include <string>

namespace spindle::ast {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;

        virtual void accept(VisitorBase& v) const;

        // "file:line" as used in diagnostics that point at a second location.
        std::string where() const;

        std::string file{};
        int line{0};
        int col{0};
    };

} // namespace spindle::ast
