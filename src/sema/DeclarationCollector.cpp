/***
 * Name: spindle::sema::DeclarationCollector (impl)
 * Purpose: Validate `<<declare>>` statements and build Declarations from them.
 */
#include "sema/DeclarationCollector.h"
#include "sema/detail/Helpers.h"

#include <string>
#include <utility>
#include <vector>

namespace spindle::sema {

std::optional<rt::ValueType> parseTypeName(const std::string& name) {
  if (name == "Number") { return rt::ValueType::Number; }
  if (name == "String") { return rt::ValueType::String; }
  if (name == "Bool" || name == "Boolean") { return rt::ValueType::Boolean; }
  return std::nullopt;
}

std::optional<rt::Value> constantValue(const ast::Expr& e) {
  switch (e.kind) {
    case ast::NodeKind::NumberLiteral: return rt::Value::Number(static_cast<const ast::NumberLiteral&>(e).value);
    case ast::NodeKind::StringLiteral: return rt::Value::String(static_cast<const ast::StringLiteral&>(e).value);
    case ast::NodeKind::BoolLiteral: return rt::Value::Boolean(static_cast<const ast::BoolLiteral&>(e).value);
    case ast::NodeKind::UnaryExpr: {
      const auto& u = static_cast<const ast::Unary&>(e);
      if (u.op == ast::UnaryOperator::Neg && u.operand && u.operand->kind == ast::NodeKind::NumberLiteral) {
        return rt::Value::Number(-static_cast<const ast::NumberLiteral&>(*u.operand).value);
      }
      return std::nullopt;
    }
    default: return std::nullopt;
  }
}

std::vector<Declaration> DeclarationCollector::collect(const ast::File& file) {
  found_.clear();
  file.accept(*this);
  return found_;
}

void DeclarationCollector::visit(const ast::NodeDecl& n) {
  nodeName_ = n.title;
  ast::Walker::visit(n);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void DeclarationCollector::visit(const ast::DeclareStmt& d) {
  if (d.variable.empty() || d.variable[0] != '$') {
    addDiag(diags_, "variable name '" + d.variable + "' must start with '$'", &d);
    return;
  }
  const Declaration* previous = findDeclaration(known_, d.variable);
  if (previous == nullptr) { previous = findDeclaration(found_, d.variable); }
  if (previous != nullptr) {
    std::string where = previous->file.empty() ? std::string("outside the script")
                                               : previous->file + ":" + std::to_string(previous->line);
    addDiag(diags_, "'" + d.variable + "' has already been declared (" + where + ")", &d);
    return;
  }

  std::optional<rt::Value> value;
  if (d.value) {
    value = constantValue(*d.value);
    if (!value) {
      addDiag(diags_, "the initial value of '" + d.variable + "' must be a constant", &d);
      return;
    }
  }
  std::optional<rt::ValueType> declared;
  if (d.typeName) {
    declared = parseTypeName(*d.typeName);
    if (!declared) {
      addDiag(diags_, "unknown type '" + *d.typeName + "' in declaration of '" + d.variable + "'", &d);
      return;
    }
    if (value && value->type() != *declared) {
      addDiag(diags_,
              "'" + d.variable + "' is declared as " + rt::to_string(*declared) + " but its initial value is a " +
                  rt::to_string(value->type()),
              &d);
      return;
    }
  }

  Declaration decl = Declaration::variable(d.variable, declared ? *declared : value->type(), value,
                                           DeclarationSource::Explicit);
  decl.file = d.file;
  decl.node = nodeName_;
  decl.line = d.line;
  found_.push_back(std::move(decl));
}

} // namespace spindle::sema
