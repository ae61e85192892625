/***
 * Name: spindle::sema::Declaration
 * Purpose: A named entry of the script's global namespace: a variable with a
 *          value type (and usually a default) or a function with a signature.
 * Theory of Operation:
 *   `source` records how the entry came to exist: written in a script
 *   (Explicit), implied by how a variable is used (Inferred), synthesized by
 *   the compiler such as visit-tracking counters (Derived), or supplied by the
 *   host through the job or its Library (External).
 */
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "runtime/Function.h"
#include "runtime/Value.h"
#include "runtime/ValueType.h"

namespace spindle::sema {

enum class DeclarationSource { Explicit, Inferred, Derived, External };

const char* to_string(DeclarationSource s);

struct Declaration {
    std::string name;
    std::variant<rt::ValueType, rt::FunctionSignature> type{rt::ValueType::Number};
    std::optional<rt::Value> defaultValue{};
    std::string description{};
    DeclarationSource source{DeclarationSource::Explicit};
    std::string file{};
    std::string node{};
    int line{0};

    bool isFunction() const { return std::holds_alternative<rt::FunctionSignature>(type); }
    bool isVariable() const { return !isFunction(); }
    rt::ValueType valueType() const { return std::get<rt::ValueType>(type); }
    const rt::FunctionSignature& signature() const { return std::get<rt::FunctionSignature>(type); }

    static Declaration variable(std::string name, rt::ValueType t, std::optional<rt::Value> def,
                                DeclarationSource source);
    static Declaration function(std::string name, rt::FunctionSignature sig, DeclarationSource source);

    bool operator==(const Declaration& o) const {
        return name == o.name && type == o.type && defaultValue == o.defaultValue && description == o.description &&
               source == o.source && file == o.file && node == o.node && line == o.line;
    }
};

// Returns the declaration named `name`, or nullptr.
const Declaration* findDeclaration(const std::vector<Declaration>& decls, const std::string& name);

} // namespace spindle::sema
