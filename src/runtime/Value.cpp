/***
 * Name: spindle::rt::Value (impl)
 * Purpose: Conversions and formatting for runtime values.
 */
#include "runtime/Value.h"
#include "spindle/exceptions/value_conversion_error.h"

#include <array>
#include <charconv>
#include <system_error>
#include <cmath>
#include <cstdlib>
#include <string>

namespace spindle::rt {

namespace {
// Fixed notation of the largest finite double plus sign and fraction digits.
constexpr std::size_t kNumberBufferSize = 512;
} // namespace

const char* to_string(ValueType t) {
  switch (t) {
    case ValueType::String: return "String";
    case ValueType::Number: return "Number";
    case ValueType::Boolean: return "Bool";
  }
  return "Unknown";
}

std::string formatNumber(double n) {
  if (std::isnan(n)) { return "NaN"; }
  if (std::isinf(n)) { return n > 0 ? "Infinity" : "-Infinity"; }
  // Shortest form that reads back as the same double, never in exponent notation.
  std::array<char, kNumberBufferSize> buf{};
  const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), n, std::chars_format::fixed);
  if (ec != std::errc{}) {
    throw exceptions::ValueConversionError("cannot format number");
  }
  std::string out{buf.data(), end};
  return out == "-0" ? "0" : out;
}

static bool parseNumber(const std::string& text, double& out) {
  if (text.empty()) { return false; }
  const char* begin = text.c_str();
  char* end = nullptr;
  out = std::strtod(begin, &end);
  return end != begin && *end == '\0';
}

double Value::asNumber() const {
  switch (type()) {
    case ValueType::Number: return std::get<1>(data_);
    case ValueType::Boolean: return std::get<2>(data_) ? 1.0 : 0.0;
    case ValueType::String: {
      double parsed = 0.0;
      if (parseNumber(std::get<0>(data_), parsed)) { return parsed; }
      throw exceptions::ValueConversionError("cannot convert string \"" + std::get<0>(data_) + "\" to Number");
    }
  }
  throw exceptions::ValueConversionError("cannot convert value to Number");
}

bool Value::asBool() const {
  switch (type()) {
    case ValueType::Boolean: return std::get<2>(data_);
    case ValueType::Number: {
      const double n = std::get<1>(data_);
      return !std::isnan(n) && n != 0.0;
    }
    case ValueType::String: {
      const auto& s = std::get<0>(data_);
      if (s == "true" || s == "True") { return true; }
      if (s == "false" || s == "False") { return false; }
      throw exceptions::ValueConversionError("cannot convert string \"" + s + "\" to Bool");
    }
  }
  throw exceptions::ValueConversionError("cannot convert value to Bool");
}

std::string Value::toString() const {
  switch (type()) {
    case ValueType::String: return std::get<0>(data_);
    case ValueType::Number: return formatNumber(std::get<1>(data_));
    case ValueType::Boolean: return std::get<2>(data_) ? "true" : "false";
  }
  return {};
}

Value Value::defaultFor(ValueType t) {
  switch (t) {
    case ValueType::String: return String("");
    case ValueType::Number: return Number(0.0);
    case ValueType::Boolean: return Boolean(false);
  }
  return {};
}

Value Value::convertTo(ValueType t) const {
  switch (t) {
    case ValueType::String: return String(toString());
    case ValueType::Number: return Number(asNumber());
    case ValueType::Boolean: return Boolean(asBool());
  }
  return *this;
}

} // namespace spindle::rt
