/***
 * Name: spindle::parse::Parser (impl)
 * Purpose: Line-oriented parser for dialogue scripts.
 */
#include "parser/Parser.h"
#include "parser/ExpressionParser.h"
#include "lexer/Lexer.h"
#include "sema/detail/Helpers.h"

#include <cctype>
#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace spindle::parse {

using TK = lex::TokenKind;

namespace {

constexpr int kTabWidth = 4;

bool isSpace(const char c) { return c == ' ' || c == '\t'; }

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && isSpace(s[b])) { ++b; }
  while (e > b && isSpace(s[e - 1])) { --e; }
  return s.substr(b, e - b);
}

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

// Index one past the matching '}' for the '{' at `open`, or npos.
std::size_t findBraceClose(const std::string& s, const std::size_t open, const std::size_t end) {
  bool inString = false;
  for (std::size_t k = open + 1; k < end; ++k) {
    const char c = s[k];
    if (inString) {
      if (c == '\\') { ++k; continue; }
      if (c == '"') { inString = false; }
      continue;
    }
    if (c == '"') { inString = true; continue; }
    if (c == '}') { return k; }
  }
  return std::string::npos;
}

// Index of the '>>' closing the '<<' at `open`, or npos.
std::size_t findCommandClose(const std::string& s, const std::size_t open) {
  bool inString = false;
  int braces = 0;
  for (std::size_t k = open + 2; k + 1 < s.size(); ++k) {
    const char c = s[k];
    if (inString) {
      if (c == '\\') { ++k; continue; }
      if (c == '"') { inString = false; }
      continue;
    }
    if (c == '"') { inString = true; continue; }
    if (c == '{') { ++braces; continue; }
    if (c == '}') { --braces; continue; }
    if (braces == 0 && c == '>' && s[k + 1] == '>') { return k; }
  }
  return std::string::npos;
}

// Removes a trailing `//` comment that is outside strings, braces and escapes.
std::string stripComment(const std::string& s) {
  bool inString = false;
  int braces = 0;
  for (std::size_t k = 0; k < s.size(); ++k) {
    const char c = s[k];
    if (c == '\\') { ++k; continue; }
    if (braces > 0 && c == '"') { inString = !inString; continue; }
    if (inString) { continue; }
    if (c == '{') { ++braces; continue; }
    if (c == '}' && braces > 0) { --braces; continue; }
    if (braces == 0 && c == '/' && k + 1 < s.size() && s[k + 1] == '/') {
      // `://` is part of a URL, not a comment
      if (k > 0 && s[k - 1] == ':') { continue; }
      return s.substr(0, k);
    }
  }
  return s;
}

// Word after `<<` when `content` is a `<<...>>` statement, e.g. "if" for `<<if $x>>`.
std::string statementKeyword(const std::string& content) {
  if (!startsWith(content, "<<")) { return {}; }
  std::size_t k = 2;
  while (k < content.size() && isSpace(content[k])) { ++k; }
  const std::size_t b = k;
  while (k < content.size() && ((std::isalnum(static_cast<unsigned char>(content[k])) != 0) || content[k] == '_')) { ++k; }
  return content.substr(b, k - b);
}

bool isIfContinuation(const std::string& keyword) {
  return keyword == "elseif" || keyword == "else" || keyword == "endif";
}

std::vector<std::string> splitWords(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream iss(s);
  std::string w;
  while (iss >> w) { out.push_back(w); }
  return out;
}

} // namespace

void Parser::record(const exceptions::ParseError& err, const int line, const int fallbackCol) {
  record(err.what(), line, err.col() > 0 ? err.col() : fallbackCol);
}

void Parser::record(const std::string& msg, const int line, const int col) {
  sema::addDiag(diags_, sema::Severity::Error, msg, src_.name(), line, col);
}

std::unique_ptr<ast::File> Parser::parseFile() {
  const std::vector<std::string>& raw = src_.lines();

  auto file = std::make_unique<ast::File>();
  located(file.get(), 1, 1);

  std::size_t i = 0;
  while (i < raw.size()) {
    const std::string t = trim(stripComment(raw[i]));
    if (t.empty()) { ++i; continue; }
    if (t[0] == '#') {
      file->fileTags.push_back(trim(t.substr(1)));
      ++i;
      continue;
    }
    break;
  }
  while (i < raw.size()) {
    const std::string t = trim(stripComment(raw[i]));
    if (t.empty()) { ++i; continue; }
    file->nodes.push_back(parseNode(raw, i));
  }
  return file;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::unique_ptr<ast::NodeDecl> Parser::parseNode(const std::vector<std::string>& raw, std::size_t& i) {
  auto node = std::make_unique<ast::NodeDecl>();
  const int startLine = static_cast<int>(i) + 1;
  located(node.get(), startLine, 1);

  bool sawSeparator = false;
  while (i < raw.size()) {
    const std::string t = trim(stripComment(raw[i]));
    const int lineNo = static_cast<int>(i) + 1;
    if (t == "---") { ++i; sawSeparator = true; break; }
    if (t.empty()) { ++i; continue; }
    if (t == "===") { break; }
    const auto colon = t.find(':');
    if (colon == std::string::npos) {
      record("expected a 'key: value' header line before '---'", lineNo, 1);
      ++i;
      continue;
    }
    std::string key = trim(t.substr(0, colon));
    std::string value = trim(t.substr(colon + 1));
    if (key == "title") {
      node->title = value;
      node->line = lineNo;
    } else if (key == "tags") {
      for (auto& tag : splitWords(value)) { node->tags.push_back(std::move(tag)); }
    }
    node->headers.emplace_back(std::move(key), std::move(value));
    ++i;
  }

  if (node->title.empty()) {
    record("node is missing a 'title' header", startLine, 1);
  } else {
    for (const char c : node->title) {
      if ((std::isalnum(static_cast<unsigned char>(c)) == 0) && c != '_' && c != '.') {
        record("node title '" + node->title + "' may only contain letters, digits, '_' and '.'", node->line, 1);
        break;
      }
    }
  }
  if (!sawSeparator) {
    record("expected '---' after the headers of node '" + node->title + "'", startLine, 1);
    if (i < raw.size()) { ++i; } // skip the stray '==='
    return node;
  }

  node->bodyLine = static_cast<int>(i) + 1;
  std::vector<SourceLine> lines;
  std::string rawBody;
  bool closed = false;
  while (i < raw.size()) {
    const std::string& r = raw[i];
    const int lineNo = static_cast<int>(i) + 1;
    ++i;
    if (trim(r) == "===") { closed = true; break; }
    if (lineNo > node->bodyLine) { rawBody += "\n"; }
    rawBody += r;

    const std::string stripped = stripComment(r);
    SourceLine sl;
    sl.number = lineNo;
    std::size_t k = 0;
    while (k < stripped.size() && isSpace(stripped[k])) {
      sl.indent += stripped[k] == '\t' ? kTabWidth : 1;
      ++k;
    }
    sl.col = static_cast<int>(k) + 1;
    sl.content = trim(stripped.substr(k));
    if (!sl.content.empty()) { lines.push_back(std::move(sl)); }
  }
  node->rawBody = std::move(rawBody);
  if (!closed) {
    record("node '" + node->title + "' is missing its closing '==='", startLine, 1);
  }

  // rawText bodies are delivered verbatim, never interpreted.
  if (node->hasTag("rawText")) { return node; }
  std::size_t j = 0;
  node->body = parseBlock(lines, j, -1, false);
  return node;
}

ast::Body Parser::parseBlock(const std::vector<SourceLine>& lines, std::size_t& j,
                                                           const int parentIndent, const bool inIf) {
  ast::Body out;
  while (j < lines.size()) {
    const SourceLine& line = lines[j];
    if (line.indent <= parentIndent) { break; }
    const std::string keyword = statementKeyword(line.content);
    if (isIfContinuation(keyword)) {
      if (inIf) { break; }
      record("'<<" + keyword + ">>' without a matching '<<if>>'", line.number, line.col);
      ++j;
      continue;
    }
    if (startsWith(line.content, "->")) {
      out.push_back(parseOptionGroup(lines, j));
      continue;
    }
    if (keyword == "if") {
      out.push_back(parseIf(lines, j, parentIndent));
      continue;
    }
    try {
      auto stmt = startsWith(line.content, "<<") ? parseStatement(line) : parseLine(line);
      if (stmt) { out.push_back(std::move(stmt)); }
    } catch (const exceptions::ParseError& err) {
      record(err, line.number, line.col);
    }
    ++j;
  }
  return out;
}

std::unique_ptr<ast::Stmt> Parser::parseOptionGroup(const std::vector<SourceLine>& lines, std::size_t& j) {
  auto group = std::make_unique<ast::OptionGroup>();
  located(group.get(), lines[j].number, lines[j].col);
  const int indent = lines[j].indent;
  while (j < lines.size() && lines[j].indent == indent && startsWith(lines[j].content, "->")) {
    const SourceLine& line = lines[j];
    auto option = std::make_unique<ast::OptionItem>();
    located(option.get(), line.number, line.col);
    try {
      auto parts = parseText(line.content, 2, line.content.size(), line.number, line.col, true, true);
      option->text = std::move(parts.text);
      option->hashtags = std::move(parts.hashtags);
      option->condition = std::move(parts.condition);
    } catch (const exceptions::ParseError& err) {
      record(err, line.number, line.col);
    }
    ++j;
    option->body = parseBlock(lines, j, indent, false);
    group->options.push_back(std::move(option));
  }
  return group;
}

std::unique_ptr<ast::Expr> Parser::parseCondition(const SourceLine& line, const std::string& keyword) {
  const std::size_t open = 0;
  const std::size_t close = findCommandClose(line.content, open);
  if (close == std::string::npos) {
    record("expected '>>' to close '<<" + keyword + "'", line.number, line.col);
  } else {
    const std::size_t kw = line.content.find(keyword, open + 2);
    const std::size_t exprBegin = kw + keyword.size();
    const std::string exprText = line.content.substr(exprBegin, close - exprBegin);
    try {
      return ExpressionParser::parseString(exprText, src_.name(), line.number, line.col + static_cast<int>(exprBegin));
    } catch (const exceptions::ParseError& err) {
      record(err, line.number, line.col);
    }
  }
  // Keep the block structure intact so later lines still parse; the error suppresses codegen.
  auto placeholder = std::make_unique<ast::BoolLiteral>(false);
  located(placeholder.get(), line.number, line.col);
  return placeholder;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseIf(const std::vector<SourceLine>& lines, std::size_t& j, const int parentIndent) {
  auto stmt = std::make_unique<ast::IfStmt>();
  const SourceLine& head = lines[j];
  located(stmt.get(), head.number, head.col);

  ast::IfClause first;
  first.cond = parseCondition(head, "if");
  ++j;
  first.body = parseBlock(lines, j, parentIndent, true);
  stmt->clauses.push_back(std::move(first));

  bool sawElse = false;
  for (;;) {
    if (j >= lines.size() || lines[j].indent <= parentIndent) {
      record("'<<if>>' is missing its '<<endif>>'", head.number, head.col);
      break;
    }
    const SourceLine& line = lines[j];
    const std::string keyword = statementKeyword(line.content);
    if (keyword == "endif") { ++j; break; }
    if (sawElse) {
      record("'<<" + keyword + ">>' after '<<else>>'", line.number, line.col);
    }
    ast::IfClause clause;
    if (keyword == "else") {
      sawElse = true;
    } else {
      clause.cond = parseCondition(line, "elseif");
    }
    ++j;
    clause.body = parseBlock(lines, j, parentIndent, true);
    stmt->clauses.push_back(std::move(clause));
  }
  return stmt;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseStatement(const SourceLine& line) {
  const std::string& s = line.content;
  const std::size_t close = findCommandClose(s, 0);
  if (close == std::string::npos) { throw exceptions::ParseError("expected '>>' to close '<<'", line.col); }
  const std::string rest = trim(s.substr(close + 2));
  if (!rest.empty() && rest[0] != '#') {
    throw exceptions::ParseError("unexpected text after '>>'", line.col + static_cast<int>(close) + 2);
  }

  std::size_t kb = 2;
  while (kb < close && isSpace(s[kb])) { ++kb; }
  std::size_t ke = kb;
  while (ke < close && !isSpace(s[ke])) { ++ke; }
  const std::string keyword = s.substr(kb, ke - kb);
  const std::string args = s.substr(ke, close - ke);
  const int argsCol = line.col + static_cast<int>(ke);

  if (keyword == "set" || keyword == "declare") {
    lex::Lexer lexer;
    lexer.pushString(args, src_.name(), line.number, argsCol);
    ExpressionParser ep(lexer);
    const auto var = ep.expect(TK::Variable, keyword == "set" ? "expected a variable after 'set'"
                                                              : "expected a variable after 'declare'");
    if (keyword == "set") {
      if (!ep.match(TK::To) && !ep.match(TK::Equal)) {
        throw exceptions::ParseError("expected 'to' or '=' after the variable", ep.peek().col);
      }
      auto value = ep.parseExpr();
      ep.expectEnd();
      auto stmt = std::make_unique<ast::SetStmt>(var.text, std::move(value));
      located(stmt.get(), line.number, line.col);
      return stmt;
    }
    auto stmt = std::make_unique<ast::DeclareStmt>(var.text);
    located(stmt.get(), line.number, line.col);
    if (ep.match(TK::Equal) || ep.match(TK::To)) { stmt->value = ep.parseExpr(); }
    if (ep.match(TK::As)) { stmt->typeName = ep.expect(TK::Ident, "expected a type name after 'as'").text; }
    ep.expectEnd();
    if (!stmt->value && !stmt->typeName) {
      throw exceptions::ParseError("declaration of '" + var.text + "' needs a value or a type", line.col);
    }
    return stmt;
  }
  if (keyword == "jump") {
    auto stmt = std::make_unique<ast::JumpStmt>();
    located(stmt.get(), line.number, line.col);
    const std::string target = trim(args);
    if (target.empty()) { throw exceptions::ParseError("expected a node name after 'jump'", argsCol); }
    if (target.front() == '{') {
      if (target.back() != '}') { throw exceptions::ParseError("expected '}' to close the jump target", argsCol); }
      const std::size_t offset = args.find('{') + 1;
      stmt->targetExpr = ExpressionParser::parseString(target.substr(1, target.size() - 2), src_.name(), line.number,
                                                       argsCol + static_cast<int>(offset));
    } else {
      if (target.find_first_of(" \t") != std::string::npos) {
        throw exceptions::ParseError("node name '" + target + "' may not contain spaces", argsCol);
      }
      stmt->target = target;
    }
    return stmt;
  }
  if (keyword == "stop") {
    if (!trim(args).empty()) { throw exceptions::ParseError("'stop' takes no arguments", argsCol); }
    auto stmt = std::make_unique<ast::StopStmt>();
    located(stmt.get(), line.number, line.col);
    return stmt;
  }
  if (keyword.empty()) { throw exceptions::ParseError("empty command", line.col); }

  auto stmt = std::make_unique<ast::CommandStmt>();
  located(stmt.get(), line.number, line.col);
  std::size_t cb = 2;
  while (cb < close && isSpace(s[cb])) { ++cb; }
  auto parts = parseText(s, cb, close, line.number, line.col, false, false);
  stmt->text = std::move(parts.text);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseLine(const SourceLine& line) {
  auto stmt = std::make_unique<ast::LineStmt>();
  located(stmt.get(), line.number, line.col);
  auto parts = parseText(line.content, 0, line.content.size(), line.number, line.col, true, false);
  stmt->text = std::move(parts.text);
  stmt->hashtags = std::move(parts.hashtags);
  return stmt;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Parser::TextParts Parser::parseText(const std::string& s, const std::size_t begin, const std::size_t end, const int line,
                                    const int baseCol, const bool allowTags, const bool allowCondition) const {
  TextParts parts;
  std::string out;
  std::size_t k = begin;
  while (k < end && isSpace(s[k])) { ++k; }
  auto colAt = [baseCol](const std::size_t idx) { return baseCol + static_cast<int>(idx); };

  while (k < end) {
    const char c = s[k];
    if (c == '\\' && k + 1 < end) {
      const char next = s[k + 1];
      if (next == '{' || next == '}' || next == '#' || next == '<' || next == '>' || next == '\\' || next == '/' ||
          next == '[' || next == ']') {
        out.push_back(next);
        k += 2;
        continue;
      }
      out.push_back(c);
      ++k;
      continue;
    }
    if (c == '{') {
      const std::size_t close = findBraceClose(s, k, end);
      if (close == std::string::npos) { throw exceptions::ParseError("expected '}' to close '{'", colAt(k)); }
      auto expr = ExpressionParser::parseString(s.substr(k + 1, close - k - 1), src_.name(), line, colAt(k + 1));
      out += "{" + std::to_string(parts.text.substitutions.size()) + "}";
      parts.text.substitutions.push_back(std::move(expr));
      k = close + 1;
      continue;
    }
    if (c == '}') { throw exceptions::ParseError("unmatched '}'", colAt(k)); }
    if (allowCondition && c == '<' && k + 1 < end && s[k + 1] == '<') {
      const std::size_t close = findCommandClose(s, k);
      if (close == std::string::npos || close >= end) {
        throw exceptions::ParseError("expected '>>' to close '<<'", colAt(k));
      }
      const std::string inner = trim(s.substr(k + 2, close - k - 2));
      if (!startsWith(inner, "if") || (inner.size() > 2 && !isSpace(inner[2]))) {
        throw exceptions::ParseError("only '<<if ...>>' may follow option text", colAt(k));
      }
      if (parts.condition) { throw exceptions::ParseError("option already has a condition", colAt(k)); }
      const std::size_t exprBegin = s.find("if", k + 2) + 2;
      parts.condition = ExpressionParser::parseString(s.substr(exprBegin, close - exprBegin), src_.name(), line,
                                                      colAt(exprBegin));
      k = close + 2;
      continue;
    }
    if (allowTags && c == '#') {
      for (const auto& word : splitWords(s.substr(k, end - k))) {
        if (word.size() < 2 || word[0] != '#') {
          throw exceptions::ParseError("expected only '#tags' at the end of the line", colAt(k));
        }
        parts.hashtags.push_back(word.substr(1));
      }
      break;
    }
    out.push_back(c);
    ++k;
  }
  while (!out.empty() && isSpace(out.back())) { out.pop_back(); }
  parts.text.text = std::move(out);
  return parts;
}

} // namespace spindle::parse
