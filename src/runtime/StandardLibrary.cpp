/***
 * Name: spindle::rt::Library::standardLibrary
 * Purpose: Operators and conversion helpers every dialogue starts with.
 * Theory of Operation:
 *   Operator names are "<Type>.<Operator>" with Type one of Number, String,
 *   Bool (see rt::to_string(ValueType)); codegen selects the entry from the
 *   operand type recorded during type checking.
 */
#include "runtime/Library.h"

#include <cmath>
#include <string>

namespace spindle::rt {

Library Library::standardLibrary() {
  Library lib;

  lib.add("Number.EqualTo", [](double a, double b) { return a == b; });
  lib.add("Number.NotEqualTo", [](double a, double b) { return a != b; });
  lib.add("Number.Add", [](double a, double b) { return a + b; });
  lib.add("Number.Minus", [](double a, double b) { return a - b; });
  lib.add("Number.Multiply", [](double a, double b) { return a * b; });
  lib.add("Number.Divide", [](double a, double b) { return a / b; });
  lib.add("Number.Modulo", [](double a, double b) { return std::fmod(a, b); });
  lib.add("Number.UnaryMinus", [](double a) { return -a; });
  lib.add("Number.GreaterThan", [](double a, double b) { return a > b; });
  lib.add("Number.GreaterThanOrEqualTo", [](double a, double b) { return a >= b; });
  lib.add("Number.LessThan", [](double a, double b) { return a < b; });
  lib.add("Number.LessThanOrEqualTo", [](double a, double b) { return a <= b; });

  lib.add("String.EqualTo", [](const std::string& a, const std::string& b) { return a == b; });
  lib.add("String.NotEqualTo", [](const std::string& a, const std::string& b) { return a != b; });
  lib.add("String.Add", [](const std::string& a, const std::string& b) { return a + b; });

  lib.add("Bool.EqualTo", [](bool a, bool b) { return a == b; });
  lib.add("Bool.NotEqualTo", [](bool a, bool b) { return a != b; });
  lib.add("Bool.And", [](bool a, bool b) { return a && b; });
  lib.add("Bool.Or", [](bool a, bool b) { return a || b; });
  lib.add("Bool.Xor", [](bool a, bool b) { return a != b; });
  lib.add("Bool.Not", [](bool a) { return !a; });

  // Conversions take an argument of any kind; a failed conversion throws ValueConversionError.
  lib.add("string", [](const Value& v) { return v.asString(); });
  lib.add("number", [](const Value& v) { return v.asNumber(); });
  lib.add("bool", [](const Value& v) { return v.asBool(); });
  lib.add("round", [](double n) { return std::round(n); });
  lib.add("floor", [](double n) { return std::floor(n); });
  lib.add("ceil", [](double n) { return std::ceil(n); });

  return lib;
}

} // namespace spindle::rt
