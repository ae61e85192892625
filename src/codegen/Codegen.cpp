/***
 * Name: spindle::codegen::Codegen (impl)
 * Purpose: Stack-machine code generation for dialogue nodes.
 */
#include "codegen/Codegen.h"
#include "sema/detail/Helpers.h"

#include <string>
#include <utility>

namespace spindle::codegen {

using ir::Opcode;

CodegenResult Codegen::generate(const ast::File& file) {
  result_ = CodegenResult{};
  file.accept(*this);
  return std::move(result_);
}

void Codegen::visit(const ast::File& f) {
  for (const auto& n : f.nodes) { n->accept(*this); }
}

void Codegen::emit(const Opcode op, std::initializer_list<ir::Operand> operands) {
  if (at_ != nullptr) {
    debug_->lineInfos[node_->instructions.size()] = {at_->line, at_->col};
  }
  node_->instructions.emplace_back(op, operands);
}

std::string Codegen::newLabel(const std::string& purpose) {
  return "L" + std::to_string(labelCounter_++) + "_" + purpose;
}

void Codegen::placeLabel(const std::string& label) {
  node_->labels[label] = node_->instructions.size();
}

void Codegen::emitBody(const ast::Body& body) {
  for (const auto& s : body) {
    at_ = s.get();
    s->accept(*this);
  }
}

std::size_t Codegen::emitSubstitutions(const ast::InterpolatedText& text) {
  for (const auto& e : text.substitutions) { e->accept(*this); }
  return text.substitutions.size();
}

std::string Codegen::operatorType(const ast::Expr& operand) {
  return rt::to_string(operand.type().value_or(rt::ValueType::Number));
}

void Codegen::visit(const ast::NodeDecl& n) {
  if (result_.program.nodes.count(n.title) != 0) {
    sema::addDiag(result_.diagnostics, "duplicate node name '" + n.title + "'", &n);
    return;
  }
  ir::Node node;
  node.name = n.title;
  node.tags = n.tags;
  for (const auto& header : n.headers) {
    if (header.first != "title" && header.first != "tags") { node.headers.push_back(header); }
  }
  node.tracked = tracked_.count(n.title) != 0;

  node_ = &result_.program.nodes.emplace(n.title, std::move(node)).first->second;
  debug_ = &result_.debugInfos[n.title];
  debug_->nodeName = n.title;
  debug_->fileName = n.file;
  labelCounter_ = 0;

  if (n.hasTag("rawText")) {
    node_->sourceTextStringId = "line:" + n.title;
  } else {
    emitBody(n.body);
    at_ = nullptr;
    emit(Opcode::Stop);
  }
  node_ = nullptr;
  debug_ = nullptr;
}

void Codegen::visit(const ast::LineStmt& s) {
  const auto count = emitSubstitutions(s.text);
  emit(Opcode::RunLine, {s.lineId, static_cast<double>(count)});
}

void Codegen::visit(const ast::CommandStmt& c) {
  const auto count = emitSubstitutions(c.text);
  emit(Opcode::RunCommand, {c.text.text, static_cast<double>(count)});
}

void Codegen::visit(const ast::OptionGroup& g) {
  std::vector<std::string> destinations;
  destinations.reserve(g.options.size());
  for (const auto& option : g.options) {
    at_ = option.get();
    destinations.push_back(newLabel("option"));
    if (option->condition) { option->condition->accept(*this); }
    const auto count = emitSubstitutions(option->text);
    emit(Opcode::AddOption, {option->lineId, destinations.back(), static_cast<double>(count),
                             option->condition != nullptr});
  }
  at_ = &g;
  emit(Opcode::ShowOptions);
  emit(Opcode::Jump);

  const std::string end = newLabel("group_end");
  for (std::size_t i = 0; i < g.options.size(); ++i) {
    placeLabel(destinations[i]);
    g.options[i]->accept(*this);
    at_ = g.options[i].get();
    emit(Opcode::JumpTo, {end});
  }
  placeLabel(end);
}

void Codegen::visit(const ast::OptionItem& o) { emitBody(o.body); }

void Codegen::visit(const ast::SetStmt& s) {
  s.value->accept(*this);
  emit(Opcode::StoreVariable, {s.variable});
  emit(Opcode::Pop);
}

void Codegen::visit(const ast::IfStmt& s) {
  const std::string end = newLabel("endif");
  for (const auto& clause : s.clauses) {
    at_ = &s;
    if (!clause.cond) {
      emitBody(clause.body);
      continue;
    }
    const std::string next = newLabel("skip_clause");
    clause.cond->accept(*this);
    emit(Opcode::JumpIfFalse, {next});
    emit(Opcode::Pop);
    emitBody(clause.body);
    at_ = &s;
    emit(Opcode::JumpTo, {end});
    placeLabel(next);
    emit(Opcode::Pop);
  }
  placeLabel(end);
}

void Codegen::visit(const ast::JumpStmt& j) {
  if (j.targetExpr) {
    j.targetExpr->accept(*this);
  } else {
    emit(Opcode::PushString, {j.target});
  }
  emit(Opcode::RunNode);
}

void Codegen::visit(const ast::StopStmt&) { emit(Opcode::Stop); }

void Codegen::visit(const ast::NumberLiteral& lit) { emit(Opcode::PushNumber, {lit.value}); }

void Codegen::visit(const ast::StringLiteral& lit) { emit(Opcode::PushString, {lit.value}); }

void Codegen::visit(const ast::BoolLiteral& lit) { emit(Opcode::PushBool, {lit.value}); }

void Codegen::visit(const ast::VariableRef& v) { emit(Opcode::PushVariable, {v.name}); }

void Codegen::visit(const ast::Call& c) {
  for (const auto& arg : c.args) { arg->accept(*this); }
  emit(Opcode::CallFunc, {c.callee, static_cast<double>(c.args.size())});
}

void Codegen::visit(const ast::Unary& u) {
  u.operand->accept(*this);
  emit(Opcode::CallFunc, {operatorType(*u.operand) + "." + ast::functionName(u.op), 1.0});
}

void Codegen::visit(const ast::Binary& b) {
  b.lhs->accept(*this);
  b.rhs->accept(*this);
  emit(Opcode::CallFunc, {operatorType(*b.lhs) + "." + ast::functionName(b.op), 2.0});
}

} // namespace spindle::codegen
