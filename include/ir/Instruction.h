/***
 * Name: spindle::ir::Instruction
 * Purpose: One opcode plus its literal operands.
 * Theory of Operation:
 *   Operands are string, number or bool literals. Label operands are strings
 *   resolved through the owning Node's label map. Typed accessors throw
 *   DialogueStateError when an operand is missing or of the wrong kind, which
 *   only happens for hand-built programs.
 */
#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "ir/Opcode.h"

namespace spindle::ir {

using Operand = std::variant<std::string, double, bool>;

struct Instruction {
    Opcode opcode{Opcode::Stop};
    std::vector<Operand> operands{};

    Instruction() = default;
    Instruction(Opcode op, std::initializer_list<Operand> ops) : opcode(op), operands(ops) {}
    explicit Instruction(Opcode op) : opcode(op) {}

    const std::string& stringOperand(std::size_t index) const;
    double numberOperand(std::size_t index) const;
    bool boolOperand(std::size_t index) const;

    bool operator==(const Instruction& other) const {
        return opcode == other.opcode && operands == other.operands;
    }
};

} // namespace spindle::ir
