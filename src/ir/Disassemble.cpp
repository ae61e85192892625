/***
 * Name: spindle::ir::disassemble (impl)
 * Purpose: Render nodes as text.
 */
#include "ir/Disassemble.h"
#include "runtime/Value.h"

#include <cstddef>
#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

namespace spindle::ir {

static std::string renderOperand(const Operand& op) {
  return std::visit([](const auto& value) -> std::string {
    using T = std::decay_t<decltype(value)>;
    if constexpr (std::is_same_v<T, std::string>) {
      return "\"" + value + "\"";
    } else if constexpr (std::is_same_v<T, double>) {
      return rt::formatNumber(value);
    } else {
      return value ? "true" : "false";
    }
  }, op);
}

std::string disassemble(const Node& node) {
  std::multimap<std::size_t, std::string> labelsAt;
  for (const auto& [label, index] : node.labels) { labelsAt.emplace(index, label); }

  std::ostringstream oss;
  oss << "node " << node.name;
  if (node.tracked) { oss << " (tracked)"; }
  oss << "\n";
  for (std::size_t i = 0; i < node.instructions.size(); ++i) {
    const auto range = labelsAt.equal_range(i);
    for (auto it = range.first; it != range.second; ++it) { oss << it->second << ":\n"; }
    const auto& ins = node.instructions[i];
    oss << "  " << i << "  " << to_string(ins.opcode);
    for (const auto& op : ins.operands) { oss << " " << renderOperand(op); }
    oss << "\n";
  }
  return oss.str();
}

std::string disassemble(const Program& program) {
  std::ostringstream oss;
  for (const auto& entry : program.nodes) { oss << disassemble(entry.second) << "\n"; }
  if (!program.initialValues.empty()) {
    oss << "initial values\n";
    for (const auto& [name, value] : program.initialValues) {
      oss << "  " << name << " = " << value.toString() << "\n";
    }
  }
  return oss.str();
}

} // namespace spindle::ir
