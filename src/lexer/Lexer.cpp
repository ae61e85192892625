/***
 * Name: spindle::lex::Lexer
 * Purpose: Tokenize expression fragments of dialogue scripts.
 */
#include "lexer/Lexer.h"
#include "spindle/exceptions/parse_error.h"

#include <cctype>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace spindle::lex {

static bool isIdentStart(char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
static bool isIdentChar(char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_' || chr == '.'; }
static bool isDigit(char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; }

static const std::map<std::string, TokenKind>& keywords() {
  static const std::map<std::string, TokenKind> kKeywords{
      {"true", TokenKind::True},   {"false", TokenKind::False}, {"to", TokenKind::To},
      {"as", TokenKind::As},       {"not", TokenKind::Not},     {"and", TokenKind::And},
      {"or", TokenKind::Or},       {"xor", TokenKind::Xor},     {"is", TokenKind::EqEq},
      {"eq", TokenKind::EqEq},     {"neq", TokenKind::NotEq},   {"lt", TokenKind::Lt},
      {"lte", TokenKind::Le},      {"gt", TokenKind::Gt},       {"gte", TokenKind::Ge}};
  return kKeywords;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::pushString(const std::string& text, const std::string& file, const int line, const int col) {
  size_t idx = 0;
  auto makeTok = [&](TokenKind kind, size_t start, std::string tokText) {
    Token tok;
    tok.kind = kind;
    tok.text = std::move(tokText);
    tok.file = file;
    tok.line = line;
    tok.col = col + static_cast<int>(start);
    tokens_.push_back(std::move(tok));
  };
  auto twoChar = [&](char second) { return idx + 1 < text.size() && text[idx + 1] == second; };

  while (idx < text.size()) {
    const char chr = text[idx];
    const size_t start = idx;
    if (chr == ' ' || chr == '\t') { ++idx; continue; }
    if (isDigit(chr) || (chr == '.' && idx + 1 < text.size() && isDigit(text[idx + 1]))) {
      while (idx < text.size() && isDigit(text[idx])) { ++idx; }
      if (idx < text.size() && text[idx] == '.') {
        ++idx;
        while (idx < text.size() && isDigit(text[idx])) { ++idx; }
      }
      makeTok(TokenKind::Number, start, text.substr(start, idx - start));
      continue;
    }
    if (chr == '"') {
      std::string value;
      ++idx;
      bool closed = false;
      while (idx < text.size()) {
        const char c = text[idx];
        if (c == '\\' && idx + 1 < text.size()) {
          const char esc = text[idx + 1];
          value.push_back(esc == 'n' ? '\n' : esc == 't' ? '\t' : esc);
          idx += 2;
          continue;
        }
        if (c == '"') { closed = true; ++idx; break; }
        value.push_back(c);
        ++idx;
      }
      if (!closed) {
        throw exceptions::ParseError("unterminated string literal", col + static_cast<int>(start));
      }
      makeTok(TokenKind::String, start, std::move(value));
      continue;
    }
    if (chr == '$') {
      ++idx;
      if (idx >= text.size() || !isIdentStart(text[idx])) {
        throw exceptions::ParseError("expected a variable name after '$'", col + static_cast<int>(start));
      }
      while (idx < text.size() && isIdentChar(text[idx])) { ++idx; }
      makeTok(TokenKind::Variable, start, text.substr(start, idx - start));
      continue;
    }
    if (isIdentStart(chr)) {
      while (idx < text.size() && isIdentChar(text[idx])) { ++idx; }
      std::string word = text.substr(start, idx - start);
      const auto kw = keywords().find(word);
      makeTok(kw != keywords().end() ? kw->second : TokenKind::Ident, start, std::move(word));
      continue;
    }
    switch (chr) {
      case '(': ++idx; makeTok(TokenKind::LParen, start, "("); continue;
      case ')': ++idx; makeTok(TokenKind::RParen, start, ")"); continue;
      case ',': ++idx; makeTok(TokenKind::Comma, start, ","); continue;
      case '+': ++idx; makeTok(TokenKind::Plus, start, "+"); continue;
      case '-': ++idx; makeTok(TokenKind::Minus, start, "-"); continue;
      case '*': ++idx; makeTok(TokenKind::Star, start, "*"); continue;
      case '/': ++idx; makeTok(TokenKind::Slash, start, "/"); continue;
      case '%': ++idx; makeTok(TokenKind::Percent, start, "%"); continue;
      case '^': ++idx; makeTok(TokenKind::Xor, start, "^"); continue;
      case '=':
        if (twoChar('=')) { idx += 2; makeTok(TokenKind::EqEq, start, "=="); continue; }
        ++idx; makeTok(TokenKind::Equal, start, "="); continue;
      case '!':
        if (twoChar('=')) { idx += 2; makeTok(TokenKind::NotEq, start, "!="); continue; }
        ++idx; makeTok(TokenKind::Not, start, "!"); continue;
      case '<':
        if (twoChar('=')) { idx += 2; makeTok(TokenKind::Le, start, "<="); continue; }
        ++idx; makeTok(TokenKind::Lt, start, "<"); continue;
      case '>':
        if (twoChar('=')) { idx += 2; makeTok(TokenKind::Ge, start, ">="); continue; }
        ++idx; makeTok(TokenKind::Gt, start, ">"); continue;
      case '&':
        if (twoChar('&')) { idx += 2; makeTok(TokenKind::And, start, "&&"); continue; }
        break;
      case '|':
        if (twoChar('|')) { idx += 2; makeTok(TokenKind::Or, start, "||"); continue; }
        break;
      default: break;
    }
    throw exceptions::ParseError("unexpected character '" + std::string(1, chr) + "'", col + static_cast<int>(start));
  }
  end_ = Token{};
  end_.file = file;
  end_.line = line;
  end_.col = col + static_cast<int>(text.size());
}

const Token& Lexer::peek(const size_t lookahead) {
  const size_t at = pos_ + lookahead;
  return at < tokens_.size() ? tokens_[at] : end_;
}

Token Lexer::next() {
  if (pos_ < tokens_.size()) { return tokens_[pos_++]; }
  return end_;
}

} // namespace spindle::lex
