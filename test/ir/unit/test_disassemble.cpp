/***
 * Name: test_disassemble
 * Purpose: Verify the human-readable rendering of compiled nodes.
 */
#include <gtest/gtest.h>
#include <string>
#include "compiler/Compiler.h"
#include "ir/Disassemble.h"

using namespace spindle;

TEST(Disassemble, RendersLabelsOpcodesAndOperands) {
  const char* src =
      "title: Start\n"
      "---\n"
      "-> Yes\n"
      "    Good.\n"
      "-> No\n"
      "===\n";
  auto result = compiler::compile(compiler::CompilationJob::fromSource(src));
  ASSERT_FALSE(result.hasErrors());
  ASSERT_TRUE(result.program.has_value());
  const std::string text = ir::disassemble(result.program->nodes.at("Start"));
  EXPECT_EQ(text.rfind("node Start\n", 0), 0u);
  EXPECT_NE(text.find("AddOption \"line:<input>-Start-0\" \"L0_option\" 0 false"), std::string::npos);
  EXPECT_NE(text.find("ShowOptions"), std::string::npos);
  EXPECT_NE(text.find("L0_option:\n"), std::string::npos);
  EXPECT_NE(text.find("Stop"), std::string::npos);
}

TEST(Disassemble, ProgramListsInitialValues) {
  const char* src =
      "title: Start\n"
      "---\n"
      "<<declare $gold = 5>>\n"
      "===\n";
  auto result = compiler::compile(compiler::CompilationJob::fromSource(src));
  ASSERT_TRUE(result.program.has_value());
  const std::string text = ir::disassemble(*result.program);
  EXPECT_NE(text.find("initial values\n  $gold = 5\n"), std::string::npos);
}
