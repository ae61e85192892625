/***
 * Name: spindle::codegen::Codegen
 * Purpose: Emit one ir::Node per dialogue node of a type-checked file.
 * Inputs:
 *   - ast::File whose expressions carry type annotations and whose lines
 *     carry line ids
 *   - Names of nodes whose visits are tracked
 * Outputs:
 *   - CodegenResult: a Program for the file, diagnostics for node names
 *     repeated within the file, per-node debug info
 * Theory of Operation:
 *   Implements ast::VisitorBase as a stack-machine emitter. Expressions push
 *   their value; operators become CallFunc("<Type>.<Op>", n) using the
 *   operand's annotated type. Control flow uses per-node labels
 *   ("L<n>_<purpose>") recorded in the node's label table. Option groups emit
 *   AddOption per choice, ShowOptions, then Jump to the label the VM pushes on
 *   selection; each choice body ends by jumping past the group.
 */
#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ast/Nodes.h"
#include "ast/VisitorBase.h"
#include "ir/Program.h"
#include "sema/Diagnostic.h"

namespace spindle::codegen {

// Source position of the statement each instruction was emitted for.
struct DebugInfo {
    std::string nodeName;
    std::string fileName;
    std::map<std::size_t, std::pair<int, int>> lineInfos; // instruction index -> (line, col)

    bool operator==(const DebugInfo& o) const {
        return nodeName == o.nodeName && fileName == o.fileName && lineInfos == o.lineInfos;
    }
};

struct CodegenResult {
    ir::Program program;
    std::vector<sema::Diagnostic> diagnostics;
    std::map<std::string, DebugInfo> debugInfos; // by node name
};

class Codegen : public ast::VisitorBase {
 public:
  explicit Codegen(const std::set<std::string>& trackedNodes) : tracked_(trackedNodes) {}

  CodegenResult generate(const ast::File& file);

  void visit(const ast::File& f) override;
  void visit(const ast::NodeDecl& n) override;
  void visit(const ast::LineStmt& s) override;
  void visit(const ast::OptionGroup& g) override;
  void visit(const ast::OptionItem& o) override;
  void visit(const ast::SetStmt& s) override;
  void visit(const ast::IfStmt& s) override;
  void visit(const ast::JumpStmt& j) override;
  void visit(const ast::StopStmt& s) override;
  void visit(const ast::CommandStmt& c) override;
  void visit(const ast::NumberLiteral& lit) override;
  void visit(const ast::StringLiteral& lit) override;
  void visit(const ast::BoolLiteral& lit) override;
  void visit(const ast::VariableRef& v) override;
  void visit(const ast::Call& c) override;
  void visit(const ast::Unary& u) override;
  void visit(const ast::Binary& b) override;

 private:
  void emit(ir::Opcode op, std::initializer_list<ir::Operand> operands = {});
  std::string newLabel(const std::string& purpose);
  void placeLabel(const std::string& label);
  void emitBody(const ast::Body& body);
  std::size_t emitSubstitutions(const ast::InterpolatedText& text);
  static std::string operatorType(const ast::Expr& operand);

  const std::set<std::string>& tracked_;
  CodegenResult result_{};
  ir::Node* node_{nullptr};
  DebugInfo* debug_{nullptr};
  const ast::Node* at_{nullptr};
  int labelCounter_{0};
};

} // namespace spindle::codegen
