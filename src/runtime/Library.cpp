/***
 * Name: spindle::rt::Library (impl)
 * Purpose: Registration, lookup and checked invocation of library functions.
 */
#include "runtime/Library.h"
#include "spindle/exceptions/argument_type_error.h"
#include "spindle/exceptions/arity_error.h"
#include "spindle/exceptions/unknown_function_error.h"

#include <sstream>

namespace spindle::rt {

std::string to_string(const FunctionSignature& sig) {
  std::ostringstream oss;
  oss << "(";
  for (std::size_t i = 0; i < sig.parameters.size(); ++i) {
    if (i != 0) { oss << ", "; }
    oss << (sig.parameters[i] ? to_string(*sig.parameters[i]) : "Any");
  }
  oss << ") -> " << to_string(sig.returnType);
  return oss.str();
}

namespace detail {

void throwArityMismatch(const std::string& name, std::size_t expected, std::size_t got) {
  std::ostringstream oss;
  oss << "function '" << name << "' expects " << expected << " argument" << (expected == 1 ? "" : "s")
      << " but was called with " << got;
  throw exceptions::ArityError(oss.str());
}

void throwArgumentType(const std::string& name, std::size_t index, ValueType expected,
                       const Value& got, const char* reason) {
  std::ostringstream oss;
  oss << "function '" << name << "' argument " << (index + 1) << " expects " << to_string(expected)
      << " but got " << to_string(got.type()) << " \"" << got.toString() << "\"";
  if (reason != nullptr) { oss << " (" << reason << ")"; }
  throw exceptions::ArgumentTypeError(oss.str());
}

} // namespace detail

Library& Library::addFunction(const std::string& name, std::shared_ptr<const Function> fn) {
  functions_[name] = std::move(fn);
  return *this;
}

const Function* Library::get(const std::string& name) const {
  const auto it = functions_.find(name);
  return it == functions_.end() ? nullptr : it->second.get();
}

Value Library::call(const std::string& name, const std::vector<Value>& args) const {
  const Function* fn = get(name);
  if (fn == nullptr) {
    throw exceptions::UnknownFunctionError("no function named '" + name + "' is registered in the library");
  }
  return fn->call(args);
}

void Library::import(const Library& other) {
  for (const auto& [name, fn] : other.functions_) { functions_[name] = fn; }
}

std::vector<std::string> Library::functionNames() const {
  std::vector<std::string> names;
  names.reserve(functions_.size());
  for (const auto& entry : functions_) { names.push_back(entry.first); }
  return names;
}

std::string Library::generateUniqueVisitedVariableForNode(const std::string& nodeName) {
  return "$Yarn.Internal.Visiting." + nodeName;
}

Library& Library::addVisitTracking(std::shared_ptr<const VariableStorage> storage) {
  auto visitCount = [storage](const std::string& node) -> double {
    const auto value = storage->get(generateUniqueVisitedVariableForNode(node));
    if (value && value->isNumber()) { return value->asNumber(); }
    return 0.0;
  };
  add(kVisitedFunction, [visitCount](const std::string& node) -> bool { return visitCount(node) > 0.0; });
  add(kVisitedCountFunction, [visitCount](const std::string& node) -> double { return visitCount(node); });
  return *this;
}

} // namespace spindle::rt
