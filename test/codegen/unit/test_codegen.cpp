/***
 * Name: test_codegen
 * Purpose: Verify the instruction streams, labels and debug info emitted per node.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "compiler/Compiler.h"

using namespace spindle;
using ir::Opcode;

static const ir::Node& startNode(const compiler::CompilationResult& r) {
  EXPECT_TRUE(r.diagnostics.empty());
  return *r.program->findNode("Start");
}

static compiler::CompilationResult compileBody(const std::string& body) {
  return compiler::compile(compiler::CompilationJob::fromSource("title: Start\n---\n" + body + "===\n"));
}

static std::vector<Opcode> opcodes(const ir::Node& n) {
  std::vector<Opcode> out;
  for (const auto& ins : n.instructions) { out.push_back(ins.opcode); }
  return out;
}

static std::vector<std::string> calledFunctions(const ir::Node& n) {
  std::vector<std::string> out;
  for (const auto& ins : n.instructions) {
    if (ins.opcode == Opcode::CallFunc) { out.push_back(ins.stringOperand(0)); }
  }
  return out;
}

TEST(Codegen, LinesEndWithStop) {
  auto r = compileBody("Hello.\nBye {1}.\n");
  const auto& n = startNode(r);
  EXPECT_EQ(opcodes(n), (std::vector<Opcode>{Opcode::RunLine, Opcode::PushNumber, Opcode::RunLine, Opcode::Stop}));
  EXPECT_EQ(n.instructions[0].numberOperand(1), 0.0);
  EXPECT_EQ(n.instructions[2].numberOperand(1), 1.0);
  EXPECT_EQ(n.instructions[0].stringOperand(0), "line:<input>-Start-0");
  EXPECT_EQ(n.instructions[2].stringOperand(0), "line:<input>-Start-1");
  EXPECT_EQ(r.stringTable.at("line:<input>-Start-1").text, "Bye {0}.");
}

TEST(Codegen, OptionGroupLayout) {
  auto r = compileBody("-> Yes\n    Great.\n-> No <<if false>>\n");
  const auto& n = startNode(r);
  EXPECT_EQ(opcodes(n), (std::vector<Opcode>{Opcode::AddOption, Opcode::PushBool, Opcode::AddOption,
                                              Opcode::ShowOptions, Opcode::Jump, Opcode::RunLine, Opcode::JumpTo,
                                              Opcode::JumpTo, Opcode::Stop}));
  EXPECT_EQ(n.instructions[0].stringOperand(1), "L0_option");
  EXPECT_FALSE(n.instructions[0].boolOperand(3));
  EXPECT_EQ(n.instructions[2].stringOperand(1), "L1_option");
  EXPECT_TRUE(n.instructions[2].boolOperand(3));
  EXPECT_EQ(n.labels.at("L0_option"), 5u);
  EXPECT_EQ(n.labels.at("L1_option"), 7u);
  EXPECT_EQ(n.labels.at("L2_group_end"), 8u);
  EXPECT_EQ(n.instructions[6].stringOperand(0), "L2_group_end");
}

TEST(Codegen, IfElseUsesPeekingBranches) {
  auto r = compileBody("<<declare $x = true>>\n<<if $x>>\nA\n<<else>>\nB\n<<endif>>\n");
  const auto& n = startNode(r);
  EXPECT_EQ(opcodes(n), (std::vector<Opcode>{Opcode::PushVariable, Opcode::JumpIfFalse, Opcode::Pop, Opcode::RunLine,
                                              Opcode::JumpTo, Opcode::Pop, Opcode::RunLine, Opcode::Stop}));
  EXPECT_EQ(n.labels.at("L1_skip_clause"), 5u);
  EXPECT_EQ(n.labels.at("L0_endif"), 7u);
}

TEST(Codegen, OperatorsCallTypedFunctions) {
  auto r = compileBody("{1 + 2} {\"a\" + \"b\"} {-3} {not true} {5 % 2 == 1} {true xor false}\n");
  const auto& n = startNode(r);
  EXPECT_EQ(calledFunctions(n), (std::vector<std::string>{"Number.Add", "String.Add", "Number.UnaryMinus", "Bool.Not",
                                                          "Number.Modulo", "Number.EqualTo", "Bool.Xor"}));
}

TEST(Codegen, SetJumpStopAndCommands) {
  auto r = compileBody("<<set $n to 2>>\n<<fade {$n}>>\n<<jump Start>>\n<<stop>>\n");
  const auto& n = startNode(r);
  EXPECT_EQ(opcodes(n), (std::vector<Opcode>{Opcode::PushNumber, Opcode::StoreVariable, Opcode::Pop,
                                              Opcode::PushVariable, Opcode::RunCommand, Opcode::PushString,
                                              Opcode::RunNode, Opcode::Stop, Opcode::Stop}));
  EXPECT_EQ(n.instructions[4].stringOperand(0), "fade {0}");
  EXPECT_EQ(n.instructions[5].stringOperand(0), "Start");
}

TEST(Codegen, HeadersTagsAndRawText) {
  auto r = compiler::compile(compiler::CompilationJob::fromSource(
      "title: Start\ntags: intro calm\ncolor: blue\n---\nHi.\n===\n"
      "title: Notes\ntags: rawText\n---\nfree {form} text\n===\n"));
  ASSERT_TRUE(r.program.has_value());
  const auto* start = r.program->findNode("Start");
  EXPECT_EQ(start->tags, (std::vector<std::string>{"intro", "calm"}));
  ASSERT_EQ(start->headers.size(), 1u);
  EXPECT_EQ(start->headers[0].first, "color");
  const auto* notes = r.program->findNode("Notes");
  EXPECT_TRUE(notes->instructions.empty());
  EXPECT_EQ(notes->sourceTextStringId, std::optional<std::string>("line:Notes"));
}

TEST(Codegen, DebugInfoMapsInstructionsToSource) {
  auto r = compileBody("First.\n\nSecond.\n");
  ASSERT_EQ(r.debugInfo.count("Start"), 1u);
  const auto& info = r.debugInfo.at("Start");
  EXPECT_EQ(info.fileName, "<input>");
  EXPECT_EQ(info.nodeName, "Start");
  EXPECT_EQ(info.lineInfos.at(0).first, 3);
  EXPECT_EQ(info.lineInfos.at(1).first, 5);
  EXPECT_EQ(info.lineInfos.count(2), 0u);
}

TEST(Codegen, DuplicateNodeInOneFileIsAnError) {
  auto r = compiler::compile(
      compiler::CompilationJob::fromSource("title: A\n---\n<<stop>>\n===\ntitle: A\n---\n<<stop>>\n===\n"));
  EXPECT_TRUE(r.hasErrors());
  EXPECT_FALSE(r.program.has_value());
  EXPECT_NE(r.diagnostics[0].message.find("duplicate node name 'A'"), std::string::npos);
}
