/***
 * Name: test_program_combine
 * Purpose: Verify Program merging: associativity over disjoint nodes and conflicts.
 */
#include <gtest/gtest.h>
#include <string>
#include "ir/Program.h"
#include "spindle/exceptions/program_conflict_error.h"

using namespace spindle;

static ir::Program programWith(const std::string& nodeName) {
  ir::Program p;
  ir::Node n;
  n.name = nodeName;
  n.instructions.emplace_back(ir::Opcode::RunLine, std::initializer_list<ir::Operand>{std::string("line:" + nodeName), 0.0});
  n.instructions.emplace_back(ir::Opcode::Stop);
  p.nodes.emplace(nodeName, n);
  return p;
}

TEST(ProgramCombine, AssociativeOverDisjointNodes) {
  const auto a = programWith("A");
  const auto b = programWith("B");
  const auto c = programWith("C");
  const auto left = ir::Program::combine({ir::Program::combine({a, b}), c});
  const auto right = ir::Program::combine({a, ir::Program::combine({b, c})});
  EXPECT_EQ(left, right);
  EXPECT_EQ(left.nodeNames(), (std::vector<std::string>{"A", "B", "C"}));
}

TEST(ProgramCombine, SharedNodeNameConflicts) {
  const auto a = programWith("A");
  EXPECT_THROW((void)ir::Program::combine({a, programWith("A")}), exceptions::ProgramConflictError);
}

TEST(ProgramCombine, FailedMergeLeavesReceiverUntouched) {
  auto a = programWith("A");
  auto other = programWith("B");
  other.nodes.emplace("A", a.nodes.at("A"));
  const auto before = a;
  EXPECT_THROW(a.merge(other), exceptions::ProgramConflictError);
  EXPECT_EQ(a, before);
}

TEST(ProgramCombine, InitialValues) {
  auto a = programWith("A");
  a.initialValues["$x"] = rt::Value::Number(1.0);
  auto b = programWith("B");
  b.initialValues["$x"] = rt::Value::Number(1.0);
  b.initialValues["$y"] = rt::Value::Boolean(true);
  const auto merged = ir::Program::combine({a, b});
  EXPECT_EQ(merged.initialValues.size(), 2u);

  auto c = programWith("C");
  c.initialValues["$x"] = rt::Value::Number(2.0);
  EXPECT_THROW((void)ir::Program::combine({a, c}), exceptions::ProgramConflictError);
}

TEST(ProgramCombine, EmptyCombineIsEmptyProgram) {
  EXPECT_EQ(ir::Program::combine({}), ir::Program{});
}

TEST(Program, LineIdsForNode) {
  auto p = programWith("A");
  p.nodes.at("A").sourceTextStringId = "line:A";
  EXPECT_EQ(p.lineIdsForNode("A"), (std::vector<std::string>{"line:A", "line:A"}));
  EXPECT_TRUE(p.lineIdsForNode("missing").empty());
  EXPECT_EQ(p.findNode("missing"), nullptr);
}
