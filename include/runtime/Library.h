/***
 * Name: spindle::rt::Library
 * Purpose: Registry of named, typed functions callable from script expressions.
 * Inputs:
 *   - Native callables registered under a name
 * Outputs:
 *   - Lookup by name, signature queries and checked calls
 * Theory of Operation:
 *   Entries are immutable rt::Function objects held by shared_ptr, so copying
 *   a Library is cheap and copies share function objects. Operators are plain
 *   entries named "<Type>.<Operator>" (for example "Number.Add"); the
 *   compiler emits calls to those names after type checking.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "runtime/Function.h"
#include "runtime/NativeFunction.h"
#include "runtime/VariableStorage.h"

namespace spindle::rt {

class Library {
public:
    // Registers (or replaces) `name`. The signature is taken from the callable's C++ types.
    template <typename F>
    Library& add(const std::string& name, F&& fn) {
        return addFunction(name, wrap(name, std::function{std::forward<F>(fn)}));
    }

    Library& addFunction(const std::string& name, std::shared_ptr<const Function> fn);

    const Function* get(const std::string& name) const;
    bool contains(const std::string& name) const { return functions_.count(name) != 0; }
    void remove(const std::string& name) { functions_.erase(name); }

    // Throws UnknownFunctionError, ArityError or ArgumentTypeError.
    Value call(const std::string& name, const std::vector<Value>& args) const;

    // Copies every entry of `other`, replacing entries with the same name.
    void import(const Library& other);

    std::vector<std::string> functionNames() const;
    std::size_t size() const { return functions_.size(); }

    // Adds visited(node) and visited_count(node), reading the node's tracking variable from `storage`.
    Library& addVisitTracking(std::shared_ptr<const VariableStorage> storage);

    static Library standardLibrary();

    // Name of the hidden Number variable counting completed visits of `nodeName`.
    static std::string generateUniqueVisitedVariableForNode(const std::string& nodeName);

    static constexpr const char* kVisitedFunction = "visited";
    static constexpr const char* kVisitedCountFunction = "visited_count";

private:
    template <typename R, typename... Args>
    static std::shared_ptr<const Function> wrap(const std::string& name, std::function<R(Args...)> fn) {
        return std::make_shared<NativeFunction<R, Args...>>(name, std::move(fn));
    }

    std::map<std::string, std::shared_ptr<const Function>> functions_;
};

} // namespace spindle::rt
