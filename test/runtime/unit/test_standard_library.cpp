/***
 * Name: test_standard_library
 * Purpose: Spot-check operator and helper entries of the standard library.
 */
#include <gtest/gtest.h>
#include "runtime/Library.h"
#include "spindle/exceptions/value_conversion_error.h"

using namespace spindle;

static rt::Value num(double d) { return rt::Value::Number(d); }
static rt::Value str(const char* s) { return rt::Value::String(s); }
static rt::Value boolean(bool b) { return rt::Value::Boolean(b); }

TEST(StandardLibrary, NumberOperators) {
  const auto lib = rt::Library::standardLibrary();
  EXPECT_EQ(lib.call("Number.Add", {num(1), num(3)}), num(4));
  EXPECT_EQ(lib.call("Number.Minus", {num(1), num(3)}), num(-2));
  EXPECT_EQ(lib.call("Number.Multiply", {num(2), num(3)}), num(6));
  EXPECT_EQ(lib.call("Number.Divide", {num(9), num(2)}), num(4.5));
  EXPECT_EQ(lib.call("Number.Modulo", {num(7), num(3)}), num(1));
  EXPECT_EQ(lib.call("Number.UnaryMinus", {num(5)}), num(-5));
  EXPECT_EQ(lib.call("Number.GreaterThan", {num(2), num(1)}), boolean(true));
  EXPECT_EQ(lib.call("Number.LessThanOrEqualTo", {num(2), num(2)}), boolean(true));
  EXPECT_EQ(lib.call("Number.NotEqualTo", {num(2), num(2)}), boolean(false));
}

TEST(StandardLibrary, StringAndBoolOperators) {
  const auto lib = rt::Library::standardLibrary();
  EXPECT_EQ(lib.call("String.Add", {str("a"), str("b")}), str("ab"));
  EXPECT_EQ(lib.call("String.EqualTo", {str("a"), str("a")}), boolean(true));
  EXPECT_EQ(lib.call("Bool.And", {boolean(true), boolean(false)}), boolean(false));
  EXPECT_EQ(lib.call("Bool.Or", {boolean(true), boolean(false)}), boolean(true));
  EXPECT_EQ(lib.call("Bool.Xor", {boolean(true), boolean(true)}), boolean(false));
  EXPECT_EQ(lib.call("Bool.Not", {boolean(true)}), boolean(false));
}

TEST(StandardLibrary, Helpers) {
  const auto lib = rt::Library::standardLibrary();
  EXPECT_EQ(lib.call("string", {num(3)}), str("3"));
  EXPECT_EQ(lib.call("number", {str("2.5")}), num(2.5));
  EXPECT_EQ(lib.call("string", {rt::Value::Boolean(true)}), str("true"));
  EXPECT_EQ(lib.call("bool", {str("false")}), rt::Value::Boolean(false));
  EXPECT_THROW((void)lib.call("number", {str("lots")}), exceptions::ValueConversionError);
  EXPECT_EQ(lib.call("round", {num(2.6)}), num(3));
  EXPECT_EQ(lib.call("floor", {num(2.6)}), num(2));
  EXPECT_EQ(lib.call("ceil", {num(2.1)}), num(3));
}
