/***
 * Name: spindle::sema::DeclarationCollector
 * Purpose: Turn `<<declare>>` statements into Declarations.
 * Inputs:
 *   - Parsed file and the declarations known so far
 * Outputs:
 *   - New Explicit declarations; diagnostics for redeclarations, non-constant
 *     initial values, unknown or conflicting `as` types and names without '$'
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ast/Walker.h"
#include "runtime/ValueType.h"
#include "sema/Declaration.h"
#include "sema/Diagnostic.h"

namespace spindle::sema {

class DeclarationCollector : public ast::Walker {
 public:
  DeclarationCollector(const std::vector<Declaration>& known, std::vector<Diagnostic>& diags)
      : known_(known), diags_(diags) {}

  std::vector<Declaration> collect(const ast::File& file);

  using ast::Walker::visit;
  void visit(const ast::NodeDecl& n) override;
  void visit(const ast::DeclareStmt& d) override;

 private:
  const std::vector<Declaration>& known_;
  std::vector<Diagnostic>& diags_;
  std::vector<Declaration> found_{};
  std::string nodeName_{};
};

// "Number", "String", "Bool"/"Boolean" to a value type.
std::optional<rt::ValueType> parseTypeName(const std::string& name);

// Value of a literal (or negated number literal) expression, if it is one.
std::optional<rt::Value> constantValue(const ast::Expr& e);

} // namespace spindle::sema
