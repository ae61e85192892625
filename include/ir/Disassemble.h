/***
 * Name: spindle::ir::disassemble
 * Purpose: Human-readable listing of compiled nodes for debugging and tests.
 * Outputs:
 *   - One instruction per line, labels on their own lines ("L0:"), operands
 *     printed as literals (strings quoted).
 */
#pragma once

#include <string>

#include "ir/Node.h"
#include "ir/Program.h"

namespace spindle::ir {

std::string disassemble(const Node& node);
std::string disassemble(const Program& program);

} // namespace spindle::ir
