/***
 * Name: spindle::ir::Instruction (impl)
 * Purpose: Checked operand accessors.
 */
#include "ir/Instruction.h"
#include "spindle/exceptions/dialogue_state_error.h"

#include <string>

namespace spindle::ir {

template <typename T>
static const T& operandAs(const Instruction& ins, const std::size_t index, const char* kind) {
  if (index < ins.operands.size()) {
    if (const T* value = std::get_if<T>(&ins.operands[index])) { return *value; }
  }
  throw exceptions::DialogueStateError(std::string("instruction ") + to_string(ins.opcode) + " has no " + kind +
                                       " operand at index " + std::to_string(index));
}

const std::string& Instruction::stringOperand(const std::size_t index) const {
  return operandAs<std::string>(*this, index, "string");
}

double Instruction::numberOperand(const std::size_t index) const {
  return operandAs<double>(*this, index, "number");
}

bool Instruction::boolOperand(const std::size_t index) const {
  return operandAs<bool>(*this, index, "bool");
}

} // namespace spindle::ir
