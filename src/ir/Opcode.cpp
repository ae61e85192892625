/***
 * Name: spindle::ir::to_string(Opcode)
 * Purpose: Stable opcode mnemonics for disassembly and logging.
 */
#include "ir/Opcode.h"

namespace spindle::ir {

const char* to_string(const Opcode op) {
  switch (op) {
    case Opcode::JumpTo: return "JumpTo";
    case Opcode::Jump: return "Jump";
    case Opcode::RunLine: return "RunLine";
    case Opcode::RunCommand: return "RunCommand";
    case Opcode::AddOption: return "AddOption";
    case Opcode::ShowOptions: return "ShowOptions";
    case Opcode::PushString: return "PushString";
    case Opcode::PushNumber: return "PushNumber";
    case Opcode::PushBool: return "PushBool";
    case Opcode::JumpIfFalse: return "JumpIfFalse";
    case Opcode::Pop: return "Pop";
    case Opcode::CallFunc: return "CallFunc";
    case Opcode::PushVariable: return "PushVariable";
    case Opcode::StoreVariable: return "StoreVariable";
    case Opcode::Stop: return "Stop";
    case Opcode::RunNode: return "RunNode";
    default: return "Unknown";
  }
}

} // namespace spindle::ir
