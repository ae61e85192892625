/***
 * Name: spindle::sema::TypeChecker
 * Purpose: Check every expression and statement against known declarations.
 * Inputs:
 *   - Parsed file; known declarations (functions and variables)
 * Outputs:
 *   - Expression type annotations (ast::Expr::annotatedType) read by codegen
 *   - Inferred variable declarations for undeclared variables whose type
 *     follows from context
 *   - Error diagnostics
 * Theory of Operation:
 *   Types flow bottom-up; an expected type flows top-down from the context
 *   (a condition expects Bool, an operand of `-` expects Number, the other
 *   operand of a binary operator expects its sibling's type). A variable that
 *   is neither declared nor inferable is "deferred": in a non-final check the
 *   caller re-checks the file once all files are seen; in the final check it
 *   is an error. Function and operator mismatches are always errors.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ast/Nodes.h"
#include "ast/Walker.h"
#include "runtime/ValueType.h"
#include "sema/Declaration.h"
#include "sema/Diagnostic.h"

namespace spindle::sema {

class TypeChecker : public ast::Walker {
 public:
  TypeChecker(std::vector<Declaration>& known, std::vector<Declaration>& inferred, std::vector<Diagnostic>& diags)
      : known_(known), inferred_(inferred), diags_(diags) {}

  // Returns false when `finalCheck` is false and some variable type could not be determined yet.
  bool check(const ast::File& file, bool finalCheck);

  using ast::Walker::visit;
  void visit(const ast::NodeDecl& n) override;
  void visit(const ast::LineStmt& s) override;
  void visit(const ast::OptionItem& o) override;
  void visit(const ast::SetStmt& s) override;
  void visit(const ast::DeclareStmt& d) override;
  void visit(const ast::IfStmt& s) override;
  void visit(const ast::JumpStmt& j) override;
  void visit(const ast::CommandStmt& c) override;

  std::optional<rt::ValueType> typeOf(const ast::Expr& e, std::optional<rt::ValueType> expected);

 private:
  // Type of `e` when it is evident without inference; no diagnostics, no annotations.
  std::optional<rt::ValueType> peekType(const ast::Expr& e) const;
  std::optional<rt::ValueType> typeOfVariable(const ast::VariableRef& v, std::optional<rt::ValueType> expected);
  std::optional<rt::ValueType> typeOfCall(const ast::Call& c);
  std::optional<rt::ValueType> typeOfUnary(const ast::Unary& u);
  std::optional<rt::ValueType> typeOfBinary(const ast::Binary& b, std::optional<rt::ValueType> expected);
  void expectType(const ast::Expr& e, rt::ValueType expected, const std::string& context);
  void checkText(const ast::InterpolatedText& text);
  const Declaration* lookup(const std::string& name) const;
  void infer(const std::string& name, rt::ValueType t, const ast::Node& at);

  std::vector<Declaration>& known_;
  std::vector<Declaration>& inferred_;
  std::vector<Diagnostic>& diags_;
  std::string nodeName_{};
  bool finalCheck_{true};
  bool deferred_{false};
};

} // namespace spindle::sema
