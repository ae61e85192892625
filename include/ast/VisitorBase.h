#pragma once

#include <string>
#include "ast/NodeKind.h"

namespace spindle::ast {

// Forward declarations to break include cycles
template <typename T, NodeKind K> struct Literal;
struct VariableRef; struct Call; struct Binary; struct Unary;
struct LineStmt; struct OptionGroup; struct OptionItem; struct SetStmt; struct DeclareStmt;
struct IfStmt; struct JumpStmt; struct StopStmt; struct CommandStmt;
struct NodeDecl; struct File;

// Virtual visitor interface for AST traversal using polymorphism.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  // One visit overload per concrete node type
  virtual void visit(const File&) = 0;
  virtual void visit(const NodeDecl&) = 0;
  virtual void visit(const LineStmt&) = 0;
  virtual void visit(const OptionGroup&) = 0;
  virtual void visit(const OptionItem&) = 0;
  virtual void visit(const SetStmt&) = 0;
  virtual void visit(const IfStmt&) = 0;
  virtual void visit(const JumpStmt&) = 0;
  virtual void visit(const CommandStmt&) = 0;
  virtual void visit(const Literal<double, NodeKind::NumberLiteral>&) = 0;
  virtual void visit(const Literal<std::string, NodeKind::StringLiteral>&) = 0;
  virtual void visit(const Literal<bool, NodeKind::BoolLiteral>&) = 0;
  virtual void visit(const VariableRef&) = 0;
  virtual void visit(const Call&) = 0;
  virtual void visit(const Unary&) = 0;
  virtual void visit(const Binary&) = 0;
  // Default no-ops for statements most passes ignore
  virtual void visit(const DeclareStmt&) {}
  virtual void visit(const StopStmt&) {}
};

} // namespace spindle::ast
