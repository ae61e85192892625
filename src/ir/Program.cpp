/***
 * Name: spindle::ir::Program (impl)
 * Purpose: Merging and static queries over compiled nodes.
 */
#include "ir/Program.h"
#include "spindle/exceptions/program_conflict_error.h"

#include <string>
#include <vector>

namespace spindle::ir {

void Program::merge(const Program& other) {
  for (const auto& entry : other.nodes) {
    if (nodes.count(entry.first) != 0) {
      throw exceptions::ProgramConflictError("node '" + entry.first + "' is defined in both programs");
    }
  }
  for (const auto& [name, value] : other.initialValues) {
    const auto it = initialValues.find(name);
    if (it != initialValues.end() && it->second != value) {
      throw exceptions::ProgramConflictError("variable '" + name + "' has conflicting initial values '" +
                                             it->second.toString() + "' and '" + value.toString() + "'");
    }
  }
  for (const auto& entry : other.nodes) { nodes.emplace(entry.first, entry.second); }
  for (const auto& entry : other.initialValues) { initialValues.emplace(entry.first, entry.second); }
}

Program Program::combine(const std::vector<Program>& programs) {
  Program out;
  for (const auto& program : programs) { out.merge(program); }
  return out;
}

const Node* Program::findNode(const std::string& name) const {
  const auto it = nodes.find(name);
  return it == nodes.end() ? nullptr : &it->second;
}

std::vector<std::string> Program::nodeNames() const {
  std::vector<std::string> names;
  names.reserve(nodes.size());
  for (const auto& entry : nodes) { names.push_back(entry.first); }
  return names;
}

std::vector<std::string> Program::lineIdsForNode(const std::string& name) const {
  std::vector<std::string> ids;
  const Node* node = findNode(name);
  if (node == nullptr) { return ids; }
  for (const auto& ins : node->instructions) {
    if (ins.opcode == Opcode::RunLine || ins.opcode == Opcode::AddOption) {
      ids.push_back(ins.stringOperand(0));
    }
  }
  if (node->sourceTextStringId) { ids.push_back(*node->sourceTextStringId); }
  return ids;
}

} // namespace spindle::ir
