/***
 * Name: spindle::parse::ExpressionParser (impl)
 * Purpose: Precedence-climbing expression parser.
 */
#include "parser/ExpressionParser.h"
#include "ast/Binary.h"
#include "ast/Call.h"
#include "ast/Literal.h"
#include "ast/Unary.h"
#include "ast/VariableRef.h"
#include "lexer/Lexer.h"
#include "spindle/exceptions/parse_error.h"

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

namespace spindle::parse {

using TK = lex::TokenKind;

template <typename T>
static std::unique_ptr<T> at(std::unique_ptr<T> node, const lex::Token& tok) {
  node->line = tok.line; node->col = tok.col; node->file = tok.file;
  return node;
}

bool ExpressionParser::match(const TK tokenKind) {
  if (peek().kind == tokenKind) { get(); return true; }
  return false;
}

lex::Token ExpressionParser::expect(const TK tokenKind, const char* msg) {
  const auto& tok = peek();
  if (tok.kind != tokenKind) {
    throw exceptions::ParseError(std::string(msg) + " (found " + lex::to_string(tok.kind) + ")", tok.col);
  }
  return get();
}

void ExpressionParser::expectEnd() {
  const auto& tok = peek();
  if (tok.kind != TK::End) {
    throw exceptions::ParseError("unexpected '" + tok.text + "' after expression", tok.col);
  }
}

std::unique_ptr<ast::Expr> ExpressionParser::parseString(const std::string& text, const std::string& file,
                                                         const int line, const int col) {
  lex::Lexer lexer;
  lexer.pushString(text, file, line, col);
  ExpressionParser parser(lexer);
  auto expr = parser.parseExpr();
  parser.expectEnd();
  return expr;
}

std::unique_ptr<ast::Expr> ExpressionParser::parseExpr() { return parseLogicalOr(); }

std::unique_ptr<ast::Expr> ExpressionParser::parseLogicalOr() {
  auto lhs = parseLogicalXor();
  while (peek().is(TK::Or)) {
    auto tok = get();
    auto rhs = parseLogicalXor();
    lhs = at(std::make_unique<ast::Binary>(ast::BinaryOperator::Or, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> ExpressionParser::parseLogicalXor() {
  auto lhs = parseLogicalAnd();
  while (peek().is(TK::Xor)) {
    auto tok = get();
    auto rhs = parseLogicalAnd();
    lhs = at(std::make_unique<ast::Binary>(ast::BinaryOperator::Xor, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> ExpressionParser::parseLogicalAnd() {
  auto lhs = parseEquality();
  while (peek().is(TK::And)) {
    auto tok = get();
    auto rhs = parseEquality();
    lhs = at(std::make_unique<ast::Binary>(ast::BinaryOperator::And, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> ExpressionParser::parseEquality() {
  auto lhs = parseComparison();
  while (peek().is(TK::EqEq) || peek().is(TK::NotEq)) {
    auto tok = get();
    const auto op = tok.kind == TK::EqEq ? ast::BinaryOperator::Eq : ast::BinaryOperator::Ne;
    auto rhs = parseComparison();
    lhs = at(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

static bool comparisonOp(const TK kind, ast::BinaryOperator& out) {
  switch (kind) {
    case TK::Lt: out = ast::BinaryOperator::Lt; return true;
    case TK::Le: out = ast::BinaryOperator::Le; return true;
    case TK::Gt: out = ast::BinaryOperator::Gt; return true;
    case TK::Ge: out = ast::BinaryOperator::Ge; return true;
    default: return false;
  }
}

std::unique_ptr<ast::Expr> ExpressionParser::parseComparison() {
  auto lhs = parseAdditive();
  ast::BinaryOperator op{};
  while (comparisonOp(peek().kind, op)) {
    auto tok = get();
    auto rhs = parseAdditive();
    lhs = at(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> ExpressionParser::parseAdditive() {
  auto lhs = parseMultiplicative();
  while (peek().is(TK::Plus) || peek().is(TK::Minus)) {
    auto tok = get();
    const auto op = tok.kind == TK::Plus ? ast::BinaryOperator::Add : ast::BinaryOperator::Sub;
    auto rhs = parseMultiplicative();
    lhs = at(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> ExpressionParser::parseMultiplicative() {
  auto lhs = parseUnary();
  while (peek().is(TK::Star) || peek().is(TK::Slash) || peek().is(TK::Percent)) {
    auto tok = get();
    const auto op = tok.kind == TK::Star    ? ast::BinaryOperator::Mul
                    : tok.kind == TK::Slash ? ast::BinaryOperator::Div
                                            : ast::BinaryOperator::Mod;
    auto rhs = parseUnary();
    lhs = at(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> ExpressionParser::parseUnary() {
  if (peek().is(TK::Minus) || peek().is(TK::Not)) {
    auto tok = get();
    const auto op = tok.kind == TK::Minus ? ast::UnaryOperator::Neg : ast::UnaryOperator::Not;
    auto operand = parseUnary();
    return at(std::make_unique<ast::Unary>(op, std::move(operand)), tok);
  }
  return parsePrimary();
}

std::unique_ptr<ast::Expr> ExpressionParser::parsePrimary() {
  const auto tok = get();
  switch (tok.kind) {
    case TK::Number:
      return at(std::make_unique<ast::NumberLiteral>(std::strtod(tok.text.c_str(), nullptr)), tok);
    case TK::String:
      return at(std::make_unique<ast::StringLiteral>(tok.text), tok);
    case TK::True:
      return at(std::make_unique<ast::BoolLiteral>(true), tok);
    case TK::False:
      return at(std::make_unique<ast::BoolLiteral>(false), tok);
    case TK::Variable:
      return at(std::make_unique<ast::VariableRef>(tok.text), tok);
    case TK::Ident: {
      auto call = at(std::make_unique<ast::Call>(tok.text), tok);
      expect(TK::LParen, "expected '(' after function name");
      if (!match(TK::RParen)) {
        do {
          call->args.push_back(parseExpr());
        } while (match(TK::Comma));
        expect(TK::RParen, "expected ')' to close argument list");
      }
      return call;
    }
    case TK::LParen: {
      auto inner = parseExpr();
      expect(TK::RParen, "expected ')'");
      return inner;
    }
    case TK::End:
      throw exceptions::ParseError("expected an expression", tok.col);
    default:
      throw exceptions::ParseError("unexpected '" + tok.text + "' in expression", tok.col);
  }
}

} // namespace spindle::parse
