#pragma once

#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace spindle::ast {

template <typename V>
void dispatch(Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::File: v.visit(static_cast<File&>(n)); break;
        case NodeKind::NodeDecl: v.visit(static_cast<NodeDecl&>(n)); break;
        case NodeKind::LineStmt: v.visit(static_cast<LineStmt&>(n)); break;
        case NodeKind::OptionGroup: v.visit(static_cast<OptionGroup&>(n)); break;
        case NodeKind::OptionItem: v.visit(static_cast<OptionItem&>(n)); break;
        case NodeKind::SetStmt: v.visit(static_cast<SetStmt&>(n)); break;
        case NodeKind::DeclareStmt: v.visit(static_cast<DeclareStmt&>(n)); break;
        case NodeKind::IfStmt: v.visit(static_cast<IfStmt&>(n)); break;
        case NodeKind::JumpStmt: v.visit(static_cast<JumpStmt&>(n)); break;
        case NodeKind::StopStmt: v.visit(static_cast<StopStmt&>(n)); break;
        case NodeKind::CommandStmt: v.visit(static_cast<CommandStmt&>(n)); break;
        case NodeKind::NumberLiteral: v.visit(static_cast<NumberLiteral&>(n)); break;
        case NodeKind::StringLiteral: v.visit(static_cast<StringLiteral&>(n)); break;
        case NodeKind::BoolLiteral: v.visit(static_cast<BoolLiteral&>(n)); break;
        case NodeKind::VariableRef: v.visit(static_cast<VariableRef&>(n)); break;
        case NodeKind::Call: v.visit(static_cast<Call&>(n)); break;
        case NodeKind::UnaryExpr: v.visit(static_cast<Unary&>(n)); break;
        case NodeKind::BinaryExpr: v.visit(static_cast<Binary&>(n)); break;
        default: break;
    }
}

template <typename V>
void dispatch(const Node& n, V& v) {
    dispatch(const_cast<Node&>(n), v);
}

} // namespace spindle::ast
