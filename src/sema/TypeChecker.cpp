/***
 * Name: spindle::sema::TypeChecker (impl)
 * Purpose: Bidirectional type checking and variable type inference.
 */
#include "sema/TypeChecker.h"
#include "sema/detail/Helpers.h"

#include <string>
#include <utility>
#include <vector>

namespace spindle::sema {

using rt::ValueType;

static std::string typeName(const ValueType t) { return rt::to_string(t); }

bool TypeChecker::check(const ast::File& file, const bool finalCheck) {
  finalCheck_ = finalCheck;
  deferred_ = false;
  file.accept(*this);
  return !deferred_;
}

const Declaration* TypeChecker::lookup(const std::string& name) const {
  return findDeclaration(known_, name);
}

void TypeChecker::infer(const std::string& name, const ValueType t, const ast::Node& at) {
  Declaration decl = Declaration::variable(name, t, rt::Value::defaultFor(t), DeclarationSource::Inferred);
  decl.description = "implicitly declared in " + at.where() + ", node " + nodeName_;
  decl.file = at.file;
  decl.node = nodeName_;
  decl.line = at.line;
  known_.push_back(decl);
  inferred_.push_back(std::move(decl));
}

void TypeChecker::visit(const ast::NodeDecl& n) {
  if (n.hasTag("rawText")) { return; }
  nodeName_ = n.title;
  ast::Walker::visit(n);
}

void TypeChecker::checkText(const ast::InterpolatedText& text) {
  for (const auto& e : text.substitutions) { typeOf(*e, std::nullopt); }
}

void TypeChecker::visit(const ast::LineStmt& s) { checkText(s.text); }

void TypeChecker::visit(const ast::CommandStmt& c) { checkText(c.text); }

void TypeChecker::visit(const ast::OptionItem& o) {
  checkText(o.text);
  if (o.condition) { expectType(*o.condition, ValueType::Boolean, "an option condition"); }
  walkBody(o.body);
}

void TypeChecker::visit(const ast::IfStmt& s) {
  for (const auto& clause : s.clauses) {
    if (clause.cond) { expectType(*clause.cond, ValueType::Boolean, "an if condition"); }
    walkBody(clause.body);
  }
}

void TypeChecker::visit(const ast::JumpStmt& j) {
  if (j.targetExpr) { expectType(*j.targetExpr, ValueType::String, "a jump target"); }
}

void TypeChecker::visit(const ast::DeclareStmt& d) {
  if (d.value) { typeOf(*d.value, std::nullopt); }
}

void TypeChecker::visit(const ast::SetStmt& s) {
  const Declaration* decl = lookup(s.variable);
  if (decl != nullptr && decl->isFunction()) {
    addDiag(diags_, "'" + s.variable + "' is a function and cannot be assigned", &s);
    return;
  }
  if (decl != nullptr) {
    expectType(*s.value, decl->valueType(), "the assignment to '" + s.variable + "'");
    return;
  }
  const auto valueType = typeOf(*s.value, std::nullopt);
  if (valueType) {
    infer(s.variable, *valueType, s);
    return;
  }
  if (finalCheck_) {
    addDiag(diags_, "can't determine the type of '" + s.variable + "'; declare it with <<declare>>", &s);
  } else {
    deferred_ = true;
  }
}

void TypeChecker::expectType(const ast::Expr& e, const ValueType expected, const std::string& context) {
  const auto actual = typeOf(e, expected);
  if (actual && *actual != expected) {
    addDiag(diags_, context + " must be " + typeName(expected) + ", not " + typeName(*actual), &e);
  }
}

std::optional<ValueType> TypeChecker::typeOf(const ast::Expr& e, const std::optional<ValueType> expected) {
  std::optional<ValueType> result;
  switch (e.kind) {
    case ast::NodeKind::NumberLiteral: result = ValueType::Number; break;
    case ast::NodeKind::StringLiteral: result = ValueType::String; break;
    case ast::NodeKind::BoolLiteral: result = ValueType::Boolean; break;
    case ast::NodeKind::VariableRef: result = typeOfVariable(static_cast<const ast::VariableRef&>(e), expected); break;
    case ast::NodeKind::Call: result = typeOfCall(static_cast<const ast::Call&>(e)); break;
    case ast::NodeKind::UnaryExpr: result = typeOfUnary(static_cast<const ast::Unary&>(e)); break;
    case ast::NodeKind::BinaryExpr: result = typeOfBinary(static_cast<const ast::Binary&>(e), expected); break;
    default: break;
  }
  if (result) { e.setType(*result); }
  return result;
}

std::optional<ValueType> TypeChecker::peekType(const ast::Expr& e) const {
  switch (e.kind) {
    case ast::NodeKind::NumberLiteral: return ValueType::Number;
    case ast::NodeKind::StringLiteral: return ValueType::String;
    case ast::NodeKind::BoolLiteral: return ValueType::Boolean;
    case ast::NodeKind::VariableRef: {
      const Declaration* decl = lookup(static_cast<const ast::VariableRef&>(e).name);
      if (decl != nullptr && decl->isVariable()) { return decl->valueType(); }
      return std::nullopt;
    }
    case ast::NodeKind::Call: {
      const Declaration* decl = lookup(static_cast<const ast::Call&>(e).callee);
      if (decl != nullptr && decl->isFunction()) { return decl->signature().returnType; }
      return std::nullopt;
    }
    case ast::NodeKind::UnaryExpr:
      return static_cast<const ast::Unary&>(e).op == ast::UnaryOperator::Neg ? ValueType::Number : ValueType::Boolean;
    case ast::NodeKind::BinaryExpr: {
      const auto& b = static_cast<const ast::Binary&>(e);
      switch (b.op) {
        case ast::BinaryOperator::Add: {
          const auto lhs = peekType(*b.lhs);
          return lhs ? lhs : peekType(*b.rhs);
        }
        case ast::BinaryOperator::Sub:
        case ast::BinaryOperator::Mul:
        case ast::BinaryOperator::Div:
        case ast::BinaryOperator::Mod: return ValueType::Number;
        default: return ValueType::Boolean;
      }
    }
    default: return std::nullopt;
  }
}

std::optional<ValueType> TypeChecker::typeOfVariable(const ast::VariableRef& v, const std::optional<ValueType> expected) {
  if (const Declaration* decl = lookup(v.name)) {
    if (decl->isFunction()) {
      addDiag(diags_, "'" + v.name + "' is a function, not a variable", &v);
      return std::nullopt;
    }
    return decl->valueType();
  }
  if (expected) {
    infer(v.name, *expected, v);
    return expected;
  }
  if (finalCheck_) {
    addDiag(diags_, "can't determine the type of '" + v.name + "'; declare it with <<declare>>", &v);
  } else {
    deferred_ = true;
  }
  return std::nullopt;
}

std::optional<ValueType> TypeChecker::typeOfCall(const ast::Call& c) {
  const Declaration* decl = lookup(c.callee);
  if (decl == nullptr || !decl->isFunction()) {
    addDiag(diags_, "undefined function '" + c.callee + "'", &c);
    for (const auto& arg : c.args) { typeOf(*arg, std::nullopt); }
    return std::nullopt;
  }
  // Copy: inference below may grow known_ and invalidate `decl`.
  const rt::FunctionSignature sig = decl->signature();
  if (sig.parameters.size() != c.args.size()) {
    addDiag(diags_,
            "function '" + c.callee + "' expects " + std::to_string(sig.parameters.size()) + " argument" +
                (sig.parameters.size() == 1 ? "" : "s") + " but got " + std::to_string(c.args.size()),
            &c);
  }
  for (std::size_t i = 0; i < c.args.size(); ++i) {
    if (i < sig.parameters.size() && sig.parameters[i]) {
      expectType(*c.args[i], *sig.parameters[i],
                 "argument " + std::to_string(i + 1) + " of '" + c.callee + "'");
    } else {
      typeOf(*c.args[i], std::nullopt);
    }
  }
  return sig.returnType;
}

std::optional<ValueType> TypeChecker::typeOfUnary(const ast::Unary& u) {
  const ValueType operand = u.op == ast::UnaryOperator::Neg ? ValueType::Number : ValueType::Boolean;
  expectType(*u.operand, operand, std::string("the operand of '") + ast::symbol(u.op) + "'");
  return operand;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::optional<ValueType> TypeChecker::typeOfBinary(const ast::Binary& b, const std::optional<ValueType> expected) {
  const std::string op = ast::symbol(b.op);
  switch (b.op) {
    case ast::BinaryOperator::Sub:
    case ast::BinaryOperator::Mul:
    case ast::BinaryOperator::Div:
    case ast::BinaryOperator::Mod:
      expectType(*b.lhs, ValueType::Number, "the left operand of '" + op + "'");
      expectType(*b.rhs, ValueType::Number, "the right operand of '" + op + "'");
      return ValueType::Number;
    case ast::BinaryOperator::Lt:
    case ast::BinaryOperator::Le:
    case ast::BinaryOperator::Gt:
    case ast::BinaryOperator::Ge:
      expectType(*b.lhs, ValueType::Number, "the left operand of '" + op + "'");
      expectType(*b.rhs, ValueType::Number, "the right operand of '" + op + "'");
      return ValueType::Boolean;
    case ast::BinaryOperator::And:
    case ast::BinaryOperator::Or:
    case ast::BinaryOperator::Xor:
      expectType(*b.lhs, ValueType::Boolean, "the left operand of '" + op + "'");
      expectType(*b.rhs, ValueType::Boolean, "the right operand of '" + op + "'");
      return ValueType::Boolean;
    default: break;
  }

  // Add, Eq, Ne: both operands share one type, taken from whichever side is known.
  std::optional<ValueType> shared = peekType(*b.lhs);
  if (!shared) { shared = peekType(*b.rhs); }
  if (!shared && b.op == ast::BinaryOperator::Add) { shared = expected; }
  const auto lhs = typeOf(*b.lhs, shared);
  const auto rhs = typeOf(*b.rhs, shared);
  if (lhs && rhs && *lhs != *rhs) {
    addDiag(diags_, "operands of '" + op + "' must have the same type, not " + typeName(*lhs) + " and " + typeName(*rhs), &b);
    return b.op == ast::BinaryOperator::Add ? std::nullopt : std::optional<ValueType>(ValueType::Boolean);
  }
  if (b.op != ast::BinaryOperator::Add) { return ValueType::Boolean; }
  if (lhs && *lhs == ValueType::Boolean) {
    addDiag(diags_, "operator '+' cannot be applied to Bool", &b);
    return std::nullopt;
  }
  return lhs;
}

} // namespace spindle::sema
