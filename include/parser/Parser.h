/***
 * Name: spindle::parse::Parser
 * Purpose: Build the syntax tree of one dialogue script file.
 * Inputs:
 *   - Line-oriented input source (file name used for locations)
 * Outputs:
 *   - ast::File, plus Error diagnostics for every malformed line
 * Theory of Operation:
 *   Reads all lines, then walks them as a small state machine:
 *     file   := { '#' tag } { node }
 *     node   := { key ':' value } '---' { body-line } '==='
 *   Body lines are grouped into statements by indentation and by
 *   <<if>>/<<elseif>>/<<else>>/<<endif>> markers:
 *     block  := { line | option-group | if | statement }
 *     option-group := { '->' text [<<if expr>>] { '#' tag } INDENT-block }
 *   Any exceptions::ParseError raised while reading a line becomes a
 *   Diagnostic at that line and parsing resumes with the next line, so one
 *   bad line never hides the rest of the file.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "ast/Nodes.h"
#include "lexer/SourceText.h"
#include "sema/Diagnostic.h"
#include "spindle/exceptions/parse_error.h"

namespace spindle::parse {

class Parser {
 public:
  explicit Parser(const lex::SourceText& src) : src_(src) {}

  std::unique_ptr<ast::File> parseFile();

  const std::vector<sema::Diagnostic>& diagnostics() const { return diags_; }

 private:
  struct SourceLine {
    std::string content; // comment stripped and trimmed
    int number{0};       // 1-based line number
    int indent{0};       // leading whitespace width (tab = 4)
    int col{1};          // 1-based column of content[0]
  };

  struct TextParts {
    ast::InterpolatedText text;
    std::vector<std::string> hashtags;
    std::unique_ptr<ast::Expr> condition;
  };

  const lex::SourceText& src_;
  std::vector<sema::Diagnostic> diags_{};

  std::unique_ptr<ast::NodeDecl> parseNode(const std::vector<std::string>& raw, std::size_t& i);
  ast::Body parseBlock(const std::vector<SourceLine>& lines, std::size_t& j,
                                                     int parentIndent, bool inIf);
  std::unique_ptr<ast::Stmt> parseOptionGroup(const std::vector<SourceLine>& lines, std::size_t& j);
  std::unique_ptr<ast::Stmt> parseIf(const std::vector<SourceLine>& lines, std::size_t& j, int parentIndent);
  std::unique_ptr<ast::Stmt> parseStatement(const SourceLine& line);
  std::unique_ptr<ast::Stmt> parseLine(const SourceLine& line);
  std::unique_ptr<ast::Expr> parseCondition(const SourceLine& line, const std::string& keyword);

  TextParts parseText(const std::string& s, std::size_t begin, std::size_t end, int line, int baseCol,
                      bool allowTags, bool allowCondition) const;

  void record(const exceptions::ParseError& err, int line, int fallbackCol);
  void record(const std::string& msg, int line, int col);

  template <typename T>
  T* located(T* node, int line, int col) const {
    node->file = src_.name();
    node->line = line;
    node->col = col;
    return node;
  }
};

} // namespace spindle::parse
