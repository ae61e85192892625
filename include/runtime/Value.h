/***
 * Name: spindle::rt::Value
 * Purpose: Tagged union {String, Number, Boolean}; the only runtime datum type.
 * Inputs:
 *   - Literal string, number or boolean
 * Outputs:
 *   - Typed accessors with script conversion rules
 * Theory of Operation:
 *   Stored as a std::variant. The as*() accessors convert between kinds the
 *   way scripts expect (numbers are truthy when non-zero, strings parse as
 *   numbers/booleans) and throw ValueConversionError when no conversion
 *   exists. toString() is the text used for line substitutions.
 */
#pragma once

#include <string>
#include <utility>
#include <variant>

#include "runtime/ValueType.h"

namespace spindle::rt {

class Value {
 public:
  Value() : data_(0.0) {}

  static Value Number(double n) { return Value(Data{std::in_place_index<1>, n}); }
  static Value String(std::string s) { return Value(Data{std::in_place_index<0>, std::move(s)}); }
  static Value Boolean(bool b) { return Value(Data{std::in_place_index<2>, b}); }

  ValueType type() const { return static_cast<ValueType>(data_.index()); }
  bool isNumber() const { return type() == ValueType::Number; }
  bool isString() const { return type() == ValueType::String; }
  bool isBoolean() const { return type() == ValueType::Boolean; }

  double asNumber() const;
  bool asBool() const;
  std::string asString() const { return toString(); }
  std::string toString() const;

  // Default value a variable of kind `t` starts with.
  static Value defaultFor(ValueType t);

  // Converts to kind `t`; throws ValueConversionError when no conversion exists.
  Value convertTo(ValueType t) const;

  bool operator==(const Value& other) const { return data_ == other.data_; }
  bool operator!=(const Value& other) const { return !(*this == other); }
  bool operator<(const Value& other) const { return data_ < other.data_; }

 private:
  // Alternative order mirrors ValueType.
  using Data = std::variant<std::string, double, bool>;
  explicit Value(Data d) : data_(std::move(d)) {}

  Data data_;
};

// Formats a number the way scripts display it: integral values have no fraction.
std::string formatNumber(double n);

} // namespace spindle::rt
