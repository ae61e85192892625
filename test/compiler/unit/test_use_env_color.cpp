/***
 * Name: test_use_env_color
 * Purpose: Verify compiler::useEnvColor respects SPINDLE_COLOR and NO_COLOR.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include "compiler/Compiler.h"

static void set_env(const char* k, const char* v) {
  if (v) { setenv(k, v, 1); } else { unsetenv(k); }
}

TEST(UseEnvColor, DefaultsFalseWhenUnset) {
  set_env("NO_COLOR", nullptr);
  set_env("SPINDLE_COLOR", nullptr);
  EXPECT_FALSE(spindle::compiler::useEnvColor());
}

TEST(UseEnvColor, RecognizesTrueValues) {
  set_env("NO_COLOR", nullptr);
  set_env("SPINDLE_COLOR", "1"); EXPECT_TRUE(spindle::compiler::useEnvColor());
  set_env("SPINDLE_COLOR", "TRUE"); EXPECT_TRUE(spindle::compiler::useEnvColor());
  set_env("SPINDLE_COLOR", "Yes"); EXPECT_TRUE(spindle::compiler::useEnvColor());
  set_env("SPINDLE_COLOR", "on"); EXPECT_TRUE(spindle::compiler::useEnvColor());
}

TEST(UseEnvColor, NoColorWins) {
  set_env("SPINDLE_COLOR", "1");
  set_env("NO_COLOR", "1");
  EXPECT_FALSE(spindle::compiler::useEnvColor());
  set_env("NO_COLOR", "");
  EXPECT_TRUE(spindle::compiler::useEnvColor());
  set_env("NO_COLOR", nullptr);
  set_env("SPINDLE_COLOR", nullptr);
}

TEST(UseEnvColor, RecognizesFalseValues) {
  set_env("SPINDLE_COLOR", "0"); EXPECT_FALSE(spindle::compiler::useEnvColor());
  set_env("SPINDLE_COLOR", "no"); EXPECT_FALSE(spindle::compiler::useEnvColor());
  set_env("SPINDLE_COLOR", ""); EXPECT_FALSE(spindle::compiler::useEnvColor());
  set_env("SPINDLE_COLOR", nullptr);
}
