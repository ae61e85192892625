/***
 * Name: spindle::sema::StringTableGenerator
 * Purpose: Collect every author-visible line of a file into the string table.
 * Inputs:
 *   - Parsed file (line ids are written back onto LineStmt/OptionItem)
 * Outputs:
 *   - StringTable entries, Error diagnostics for duplicate explicit ids
 * Theory of Operation:
 *   A `#line:xyz` hashtag gives the explicit id `line:xyz`. Lines without one
 *   get `line:<file>-<node>-<n>`, n counting implicit ids within the node, so
 *   identical sources always produce identical ids. rawText nodes contribute
 *   their whole body under `line:<node>`.
 */
#pragma once

#include <string>
#include <vector>

#include "ast/Walker.h"
#include "compiler/StringInfo.h"
#include "sema/Diagnostic.h"

namespace spindle::sema {

class StringTableGenerator : public ast::Walker {
 public:
  StringTableGenerator(compiler::StringTable& table, std::vector<Diagnostic>& diags) : table_(table), diags_(diags) {}

  void generate(const ast::File& file);

  bool containsImplicitStringTags() const { return implicit_; }

  using ast::Walker::visit;
  void visit(const ast::NodeDecl& n) override;
  void visit(const ast::LineStmt& s) override;
  void visit(const ast::OptionItem& o) override;

 private:
  std::string assignId(const ast::Node& at, const ast::InterpolatedText& text,
                       const std::vector<std::string>& hashtags);

  compiler::StringTable& table_;
  std::vector<Diagnostic>& diags_;
  std::string fileName_{};
  std::string nodeName_{};
  int implicitCounter_{0};
  bool implicit_{false};
};

} // namespace spindle::sema
