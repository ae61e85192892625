#pragma once

namespace spindle::ast {

enum class BinaryOperator {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
    Xor
};

// Library operator suffix, e.g. "Add" in "Number.Add".
const char* functionName(BinaryOperator op);
const char* symbol(BinaryOperator op);

} // namespace spindle::ast
