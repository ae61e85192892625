/***
 * Name: spindle::obs::AstPrinter
 * Purpose: Visitor-based AST pretty-printer for diagnostics/logging.
 * Inputs:
 *   - ast::File
 * Outputs:
 *   - Formatted string with node kinds and salient fields.
 *   - Tree geometry (node count, max depth) of the last printed file.
 * Theory of Operation:
 *   Implements ast::VisitorBase to traverse nodes, collecting a textual
 *   representation with indentation reflecting tree depth.
 */
#pragma once

#include <algorithm>
#include <sstream>
#include <string>
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"
#include "observability/Metrics.h"
#include "runtime/Value.h"

namespace spindle::obs {

class AstPrinter : public ast::VisitorBase {
 public:
  std::string print(const ast::File& f) {
    ss_.str(""); ss_.clear(); depth_ = 0; geom_ = AstGeometry{};
    f.accept(*this);
    return ss_.str();
  }

  const AstGeometry& geometry() const { return geom_; }

  void visit(const ast::File& f) override { line("File"); depth_++; for (const auto& n : f.nodes) n->accept(*this); depth_--; }
  void visit(const ast::NodeDecl& n) override { line(std::string("NodeDecl title=") + n.title); depth_++; body(n.body); depth_--; }
  void visit(const ast::LineStmt& s) override { line("LineStmt \"" + s.text.text + "\""); depth_++; text(s.text); depth_--; }
  void visit(const ast::OptionGroup& g) override { line("OptionGroup"); depth_++; for (const auto& o : g.options) o->accept(*this); depth_--; }
  void visit(const ast::OptionItem& o) override { line("OptionItem \"" + o.text.text + "\""); depth_++; text(o.text); if (o.condition) { label("Cond:"); depth_++; o.condition->accept(*this); depth_--; } if (!o.body.empty()) { label("Body:"); depth_++; body(o.body); depth_--; } depth_--; }
  void visit(const ast::SetStmt& s) override { line(std::string("SetStmt target=") + s.variable); depth_++; if (s.value) s.value->accept(*this); depth_--; }
  void visit(const ast::DeclareStmt& d) override { line(std::string("DeclareStmt name=") + d.variable + (d.typeName ? ", as=" + *d.typeName : "")); depth_++; if (d.value) d.value->accept(*this); depth_--; }
  void visit(const ast::IfStmt& i) override { line("IfStmt"); depth_++; for (const auto& c : i.clauses) { if (c.cond) { label("Cond:"); depth_++; c.cond->accept(*this); depth_--; label("Then:"); } else { label("Else:"); } depth_++; body(c.body); depth_--; } depth_--; }
  void visit(const ast::JumpStmt& j) override { if (j.targetExpr) { line("JumpStmt"); depth_++; j.targetExpr->accept(*this); depth_--; } else { line(std::string("JumpStmt target=") + j.target); } }
  void visit(const ast::StopStmt&) override { line("StopStmt"); }
  void visit(const ast::CommandStmt& c) override { line("CommandStmt \"" + c.text.text + "\""); depth_++; text(c.text); depth_--; }
  void visit(const ast::NumberLiteral& lit) override { line(std::string("NumberLiteral ") + rt::formatNumber(lit.value)); }
  void visit(const ast::StringLiteral& lit) override { line(std::string("StringLiteral \"") + lit.value + "\""); }
  void visit(const ast::BoolLiteral& lit) override { line(std::string("BoolLiteral ") + (lit.value ? "true" : "false")); }
  void visit(const ast::VariableRef& v) override { line(std::string("VariableRef ") + v.name); }
  void visit(const ast::Call& c) override { line(std::string("Call ") + c.callee); depth_++; for (const auto& a : c.args) a->accept(*this); depth_--; }
  void visit(const ast::Binary& b) override { line(std::string("Binary ") + ast::symbol(b.op)); depth_++; if (b.lhs) b.lhs->accept(*this); if (b.rhs) b.rhs->accept(*this); depth_--; }
  void visit(const ast::Unary& u) override { line(std::string("Unary ") + ast::symbol(u.op)); depth_++; if (u.operand) u.operand->accept(*this); depth_--; }

 private:
  void body(const ast::Body& stmts) { for (const auto& s : stmts) s->accept(*this); }
  void text(const ast::InterpolatedText& t) { for (const auto& e : t.substitutions) e->accept(*this); }
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void label(const std::string& s) { indent(); ss_ << s << "\n"; }
  void line(const std::string& s) {
    indent(); ss_ << s << "\n";
    geom_.nodes++;
    geom_.maxDepth = std::max<uint64_t>(geom_.maxDepth, static_cast<uint64_t>(depth_));
  }
  std::ostringstream ss_{};
  int depth_{0};
  AstGeometry geom_{};
};

} // namespace spindle::obs
