#pragma once

namespace spindle::ast {

enum class UnaryOperator {
    Neg,
    Not
};

// Library operator suffix, e.g. "UnaryMinus" in "Number.UnaryMinus".
inline const char* functionName(const UnaryOperator op) {
    return op == UnaryOperator::Neg ? "UnaryMinus" : "Not";
}

inline const char* symbol(const UnaryOperator op) {
    return op == UnaryOperator::Neg ? "-" : "!";
}

} // namespace spindle::ast
