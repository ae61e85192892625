/***
 * Name: spindle::rt::Function
 * Purpose: Uniform callable interface for library entries.
 * Inputs:
 *   - Ordered argument Values
 * Outputs:
 *   - Result Value
 * Theory of Operation:
 *   Every entry has a fixed signature captured at registration. call()
 *   validates argument count and kinds before dispatching to native code.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "runtime/Value.h"
#include "runtime/ValueType.h"

namespace spindle::rt {

struct FunctionSignature {
    // std::nullopt accepts a value of any kind.
    std::vector<std::optional<ValueType>> parameters;
    ValueType returnType{ValueType::Number};

    bool operator==(const FunctionSignature& other) const {
        return parameters == other.parameters && returnType == other.returnType;
    }
};

// Renders as "(Number, String) -> Bool"; a parameter of any kind renders as "Any".
std::string to_string(const FunctionSignature& sig);

class Function {
public:
    virtual ~Function() = default;

    virtual const FunctionSignature& signature() const = 0;
    std::size_t arity() const { return signature().parameters.size(); }

    // Throws ArityError / ArgumentTypeError before running native code.
    virtual Value call(const std::vector<Value>& args) const = 0;
};

} // namespace spindle::rt
