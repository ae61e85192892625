/***
 * Name: test_value
 * Purpose: Verify Value kinds, conversions and number formatting.
 */
#include <gtest/gtest.h>
#include "runtime/Value.h"
#include "spindle/exceptions/value_conversion_error.h"

using namespace spindle;

TEST(Value, KindsAndAccessors) {
  EXPECT_TRUE(rt::Value::Number(3.5).isNumber());
  EXPECT_TRUE(rt::Value::String("x").isString());
  EXPECT_TRUE(rt::Value::Boolean(true).isBoolean());
  EXPECT_DOUBLE_EQ(rt::Value::Number(3.5).asNumber(), 3.5);
  EXPECT_EQ(rt::Value::String("hi").asString(), "hi");
}

TEST(Value, NumbersFormatWithoutTrailingFraction) {
  EXPECT_EQ(rt::Value::Number(4.0).toString(), "4");
  EXPECT_EQ(rt::Value::Number(-2.0).toString(), "-2");
  EXPECT_EQ(rt::Value::Number(2.5).toString(), "2.5");
  EXPECT_EQ(rt::Value::Boolean(false).toString(), "false");
}

TEST(Value, LargeNumbersKeepEveryDigit) {
  EXPECT_EQ(rt::Value::Number(12345678.0).toString(), "12345678");
  EXPECT_EQ(rt::Value::Number(1234567.5).toString(), "1234567.5");
  EXPECT_EQ(rt::Value::Number(10000005.0).toString(), "10000005");
  EXPECT_EQ(rt::Value::Number(0.125).toString(), "0.125");
  EXPECT_EQ(rt::Value::Number(-0.0).toString(), "0");
}

TEST(Value, Conversions) {
  EXPECT_DOUBLE_EQ(rt::Value::String("12.5").asNumber(), 12.5);
  EXPECT_DOUBLE_EQ(rt::Value::Boolean(true).asNumber(), 1.0);
  EXPECT_TRUE(rt::Value::Number(2.0).asBool());
  EXPECT_FALSE(rt::Value::Number(0.0).asBool());
  EXPECT_TRUE(rt::Value::String("true").asBool());
  EXPECT_EQ(rt::Value::Number(7.0).convertTo(rt::ValueType::String), rt::Value::String("7"));
}

TEST(Value, FailedConversionThrows) {
  EXPECT_THROW((void)rt::Value::String("abc").asNumber(), exceptions::ValueConversionError);
  EXPECT_THROW((void)rt::Value::String("maybe").asBool(), exceptions::ValueConversionError);
  EXPECT_THROW((void)rt::Value::String("x").convertTo(rt::ValueType::Number), exceptions::ValueConversionError);
}

TEST(Value, DefaultsPerKind) {
  EXPECT_EQ(rt::Value::defaultFor(rt::ValueType::Number), rt::Value::Number(0.0));
  EXPECT_EQ(rt::Value::defaultFor(rt::ValueType::String), rt::Value::String(""));
  EXPECT_EQ(rt::Value::defaultFor(rt::ValueType::Boolean), rt::Value::Boolean(false));
}

TEST(Value, EqualityIsKindSensitive) {
  EXPECT_NE(rt::Value::Number(1.0), rt::Value::Boolean(true));
  EXPECT_NE(rt::Value::String("1"), rt::Value::Number(1.0));
}
