/***
 * Name: spindle::parse::ExpressionParser
 * Purpose: Recursive-descent parser for script expressions.
 * Inputs:
 *   - Token stream from lex::Lexer
 * Outputs:
 *   - ast::Expr tree; exceptions::ParseError on malformed input
 * Theory of Operation:
 *   Precedence, lowest first:
 *     or  := xor { ('||' | 'or') xor }
 *     xor := and { ('^' | 'xor') and }
 *     and := eq { ('&&' | 'and') eq }
 *     eq  := cmp { ('==' | '!=' | 'is' | 'eq' | 'neq') cmp }
 *     cmp := add { ('<' | '<=' | '>' | '>=' | 'lt' | 'lte' | 'gt' | 'gte') add }
 *     add := mul { ('+' | '-') mul }
 *     mul := unary { ('*' | '/' | '%') unary }
 *     unary := ('-' | '!' | 'not') unary | primary
 *     primary := NUMBER | STRING | true | false | VARIABLE | IDENT '(' [args] ')' | '(' or ')'
 */
#pragma once

#include <memory>
#include <string>

#include "ast/Expr.h"
#include "lexer/Token.h"
#include "lexer/TokenKind.h"

namespace spindle::parse {

class ExpressionParser {
 public:
  explicit ExpressionParser(lex::TokenStream& stream) : ts_(stream) {}

  std::unique_ptr<ast::Expr> parseExpr();

  const lex::Token& peek() { return ts_.peek(); }
  lex::Token get() { return ts_.next(); }
  bool match(lex::TokenKind tokenKind);
  lex::Token expect(lex::TokenKind tokenKind, const char* msg);
  // Throws unless every token has been consumed.
  void expectEnd();

  // Lexes and parses `text` as one complete expression; `col` is the column of text[0].
  static std::unique_ptr<ast::Expr> parseString(const std::string& text, const std::string& file, int line, int col);

 private:
  lex::TokenStream& ts_;

  std::unique_ptr<ast::Expr> parseLogicalOr();
  std::unique_ptr<ast::Expr> parseLogicalXor();
  std::unique_ptr<ast::Expr> parseLogicalAnd();
  std::unique_ptr<ast::Expr> parseEquality();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePrimary();
};

} // namespace spindle::parse
