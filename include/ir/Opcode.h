/***
 * Name: spindle::ir::Opcode
 * Purpose: Operation codes understood by the virtual machine.
 */
#pragma once

namespace spindle::ir {

enum class Opcode {
    JumpTo,        // label
    Jump,          // pops label
    RunLine,       // lineId, substitutionCount
    RunCommand,    // text, substitutionCount
    AddOption,     // lineId, label, substitutionCount, hasCondition
    ShowOptions,
    PushString,    // string
    PushNumber,    // number
    PushBool,      // bool
    JumpIfFalse,   // label (peeks)
    Pop,
    CallFunc,      // name, argumentCount
    PushVariable,  // name
    StoreVariable, // name (peeks)
    Stop,
    RunNode        // pops node name
};

const char* to_string(Opcode op);

} // namespace spindle::ir
