/***
 * Name: spindle::ast::Walker
 * Purpose: VisitorBase whose default visits descend into every child.
 * Theory of Operation:
 *   Passes that only care about a few node kinds derive from Walker and
 *   override those visits, calling the Walker version to keep descending.
 */
#pragma once

#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace spindle::ast {

struct Walker : VisitorBase {
  void visit(const File& f) override { for (const auto& n : f.nodes) { n->accept(*this); } }
  void visit(const NodeDecl& n) override { walkBody(n.body); }
  void visit(const LineStmt& s) override { walkText(s.text); }
  void visit(const OptionGroup& g) override { for (const auto& o : g.options) { o->accept(*this); } }
  void visit(const OptionItem& o) override {
    walkText(o.text);
    if (o.condition) { o.condition->accept(*this); }
    walkBody(o.body);
  }
  void visit(const SetStmt& s) override { if (s.value) { s.value->accept(*this); } }
  void visit(const DeclareStmt& d) override { if (d.value) { d.value->accept(*this); } }
  void visit(const IfStmt& s) override {
    for (const auto& c : s.clauses) {
      if (c.cond) { c.cond->accept(*this); }
      walkBody(c.body);
    }
  }
  void visit(const JumpStmt& j) override { if (j.targetExpr) { j.targetExpr->accept(*this); } }
  void visit(const CommandStmt& c) override { walkText(c.text); }
  void visit(const NumberLiteral&) override {}
  void visit(const StringLiteral&) override {}
  void visit(const BoolLiteral&) override {}
  void visit(const VariableRef&) override {}
  void visit(const Call& c) override { for (const auto& a : c.args) { a->accept(*this); } }
  void visit(const Unary& u) override { if (u.operand) { u.operand->accept(*this); } }
  void visit(const Binary& b) override {
    if (b.lhs) { b.lhs->accept(*this); }
    if (b.rhs) { b.rhs->accept(*this); }
  }

 protected:
  void walkBody(const Body& body) {
    for (const auto& s : body) { s->accept(*this); }
  }
  void walkText(const InterpolatedText& t) {
    for (const auto& e : t.substitutions) { e->accept(*this); }
  }
};

} // namespace spindle::ast
