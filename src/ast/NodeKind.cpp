/***
 * Name: spindle::ast::to_string
 * Purpose: Stable names for node kinds and operators used by printers and diagnostics.
 */
#include "ast/NodeKind.h"
#include "ast/BinaryOperator.h"

namespace spindle::ast {

const char* to_string(const NodeKind k) {
    switch (k) {
        case NodeKind::File: return "File";
        case NodeKind::NodeDecl: return "NodeDecl";
        case NodeKind::LineStmt: return "LineStmt";
        case NodeKind::OptionGroup: return "OptionGroup";
        case NodeKind::OptionItem: return "OptionItem";
        case NodeKind::SetStmt: return "SetStmt";
        case NodeKind::DeclareStmt: return "DeclareStmt";
        case NodeKind::IfStmt: return "IfStmt";
        case NodeKind::JumpStmt: return "JumpStmt";
        case NodeKind::StopStmt: return "StopStmt";
        case NodeKind::CommandStmt: return "CommandStmt";
        case NodeKind::NumberLiteral: return "NumberLiteral";
        case NodeKind::StringLiteral: return "StringLiteral";
        case NodeKind::BoolLiteral: return "BoolLiteral";
        case NodeKind::VariableRef: return "VariableRef";
        case NodeKind::Call: return "Call";
        case NodeKind::UnaryExpr: return "UnaryExpr";
        case NodeKind::BinaryExpr: return "BinaryExpr";
        default: return "unknown";
    }
}

const char* functionName(const BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add: return "Add";
        case BinaryOperator::Sub: return "Minus";
        case BinaryOperator::Mul: return "Multiply";
        case BinaryOperator::Div: return "Divide";
        case BinaryOperator::Mod: return "Modulo";
        case BinaryOperator::Eq: return "EqualTo";
        case BinaryOperator::Ne: return "NotEqualTo";
        case BinaryOperator::Lt: return "LessThan";
        case BinaryOperator::Le: return "LessThanOrEqualTo";
        case BinaryOperator::Gt: return "GreaterThan";
        case BinaryOperator::Ge: return "GreaterThanOrEqualTo";
        case BinaryOperator::And: return "And";
        case BinaryOperator::Or: return "Or";
        case BinaryOperator::Xor: return "Xor";
        default: return "unknown";
    }
}

const char* symbol(const BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add: return "+";
        case BinaryOperator::Sub: return "-";
        case BinaryOperator::Mul: return "*";
        case BinaryOperator::Div: return "/";
        case BinaryOperator::Mod: return "%";
        case BinaryOperator::Eq: return "==";
        case BinaryOperator::Ne: return "!=";
        case BinaryOperator::Lt: return "<";
        case BinaryOperator::Le: return "<=";
        case BinaryOperator::Gt: return ">";
        case BinaryOperator::Ge: return ">=";
        case BinaryOperator::And: return "&&";
        case BinaryOperator::Or: return "||";
        case BinaryOperator::Xor: return "^";
        default: return "?";
    }
}

} // namespace spindle::ast
