/***
 * Name: test_virtual_machine
 * Purpose: Verify execution, option selection, jumps, state transitions and error handling.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "compiler/Compiler.h"
#include "observability/Metrics.h"
#include "runtime/MemoryVariableStorage.h"
#include "spindle/exceptions/dialogue_state_error.h"
#include "spindle/exceptions/invalid_option_error.h"
#include "spindle/exceptions/unknown_function_error.h"
#include "spindle/exceptions/unknown_node_error.h"
#include "vm/VirtualMachine.h"

using namespace spindle;
using vm::ExecutionState;

struct Harness {
  std::shared_ptr<rt::MemoryVariableStorage> storage = std::make_shared<rt::MemoryVariableStorage>();
  std::shared_ptr<rt::Library> library;
  std::unique_ptr<vm::VirtualMachine> machine;
  std::vector<std::string> events;
  std::vector<vm::Line> lines;
  std::vector<vm::DialogueOption> options;

  explicit Harness(const std::string& source) {
    auto result = compiler::compile(compiler::CompilationJob::fromSource(source));
    EXPECT_TRUE(result.diagnostics.empty());
    library = std::make_shared<rt::Library>(rt::Library::standardLibrary());
    library->addVisitTracking(storage);
    machine = std::make_unique<vm::VirtualMachine>(library, storage);
    machine->setProgram(std::make_shared<const ir::Program>(*result.program));
    auto& h = machine->handlers();
    h.line = [this](const vm::Line& l) { lines.push_back(l); events.push_back("line"); };
    h.options = [this](const std::vector<vm::DialogueOption>& o) { options = o; events.push_back("options"); };
    h.command = [this](const vm::Command& c) { events.push_back("command:" + c.text); };
    h.nodeStart = [this](const std::string& n) { events.push_back("start:" + n); };
    h.nodeComplete = [this](const std::string& n) { events.push_back("complete:" + n); };
    h.dialogueComplete = [this]() { events.push_back("done"); };
  }

  // Continues until the dialogue stops or options are presented.
  void runToPause() {
    machine->continueDialogue();
    while (machine->executionState() == ExecutionState::WaitingForContinue) { machine->continueDialogue(); }
  }
};

TEST(VirtualMachine, DeliversLinesWithSubstitutions) {
  Harness t("title: test\n---\nfoo\nbar\na {1 + 3} cool expression\n===\n");
  t.machine->setNode("test");
  EXPECT_EQ(t.machine->executionState(), ExecutionState::WaitingForContinue);
  t.machine->continueDialogue();
  EXPECT_EQ(t.machine->executionState(), ExecutionState::WaitingForContinue);
  ASSERT_EQ(t.lines.size(), 1u);
  t.runToPause();
  ASSERT_EQ(t.lines.size(), 3u);
  EXPECT_EQ(t.lines[2].substitutions, std::vector<std::string>{"4"});
  EXPECT_EQ(t.machine->executionState(), ExecutionState::Stopped);
  EXPECT_EQ(t.events, (std::vector<std::string>{"start:test", "line", "line", "line", "complete:test", "done"}));
}

TEST(VirtualMachine, OptionsWaitForSelection) {
  Harness t("title: Start\n---\nPick.\n-> Red\n    You chose red.\n-> Blue <<if false>>\nEnd.\n===\n");
  t.machine->setNode("Start");
  t.runToPause();
  EXPECT_EQ(t.machine->executionState(), ExecutionState::WaitingOnOptionSelection);
  ASSERT_EQ(t.options.size(), 2u);
  EXPECT_EQ(t.options[0].id, 0u);
  EXPECT_TRUE(t.options[0].isAvailable);
  EXPECT_EQ(t.options[1].id, 1u);
  EXPECT_FALSE(t.options[1].isAvailable);

  EXPECT_THROW(t.machine->continueDialogue(), exceptions::DialogueStateError);
  EXPECT_THROW(t.machine->setSelectedOption(7), exceptions::InvalidOptionError);
  EXPECT_EQ(t.machine->executionState(), ExecutionState::WaitingOnOptionSelection);

  t.machine->setSelectedOption(0);
  EXPECT_EQ(t.machine->executionState(), ExecutionState::WaitingForContinue);
  EXPECT_THROW(t.machine->setSelectedOption(0), exceptions::InvalidOptionError);
  t.runToPause();
  ASSERT_EQ(t.lines.size(), 3u);
  EXPECT_EQ(t.lines[1].id, "line:<input>-Start-2");
  EXPECT_EQ(t.events.back(), "done");
}

TEST(VirtualMachine, UnavailableOptionsArePresented) {
  Harness t("title: Start\n---\n-> Hidden <<if false>>\n    Unreachable.\n===\n");
  t.machine->setNode("Start");
  t.runToPause();
  EXPECT_EQ(t.machine->executionState(), ExecutionState::WaitingOnOptionSelection);
  ASSERT_EQ(t.options.size(), 1u);
  EXPECT_FALSE(t.options[0].isAvailable);
}

static std::shared_ptr<const ir::Program> singleNodeProgram(const std::string& name,
                                                            std::vector<ir::Instruction> instructions) {
  ir::Program program;
  ir::Node node;
  node.name = name;
  node.instructions = std::move(instructions);
  program.nodes.emplace(name, std::move(node));
  return std::make_shared<const ir::Program>(std::move(program));
}

TEST(VirtualMachine, EmptyOptionSetEndsDialogue) {
  auto storage = std::make_shared<rt::MemoryVariableStorage>();
  vm::VirtualMachine machine(std::make_shared<rt::Library>(rt::Library::standardLibrary()), storage);
  bool done = false;
  bool offered = false;
  machine.handlers().dialogueComplete = [&done]() { done = true; };
  machine.handlers().options = [&offered](const std::vector<vm::DialogueOption>&) { offered = true; };
  machine.setProgram(singleNodeProgram("Empty", {ir::Instruction(ir::Opcode::ShowOptions), ir::Instruction(ir::Opcode::Jump)}));
  machine.setNode("Empty");
  machine.continueDialogue();
  EXPECT_TRUE(done);
  EXPECT_FALSE(offered);
  EXPECT_EQ(machine.executionState(), ExecutionState::Stopped);
}

TEST(VirtualMachine, VariablesBranchesAndCommands) {
  Harness t(
      "title: Start\n---\n<<declare $gold = 5>>\n"
      "<<set $gold to $gold * 2>>\n"
      "<<if $gold > 8>>\n  Rich.\n<<else>>\n  Poor.\n<<endif>>\n"
      "<<shake {$gold} times>>\n===\n");
  t.machine->setNode("Start");
  t.runToPause();
  EXPECT_EQ(t.storage->get("$gold"), std::optional<rt::Value>(rt::Value::Number(10.0)));
  ASSERT_EQ(t.lines.size(), 1u);
  EXPECT_EQ(t.lines[0].id, "line:<input>-Start-0");
  EXPECT_NE(std::find(t.events.begin(), t.events.end(), "command:shake 10 times"), t.events.end());
}

TEST(VirtualMachine, JumpCompletesNodeAndTracksVisits) {
  Harness t(
      "title: Start\n---\n<<jump Shop>>\n===\n"
      "title: Shop\n---\nSeen {visited_count(\"Shop\")} times.\n<<jump Door>>\n===\n"
      "title: Door\n---\n{visited(\"Shop\")}\n===\n");
  t.machine->setNode("Start");
  t.runToPause();
  EXPECT_EQ(t.events, (std::vector<std::string>{"start:Start", "complete:Start", "start:Shop", "line",
                                                "complete:Shop", "start:Door", "line", "complete:Door", "done"}));
  EXPECT_EQ(t.lines[0].substitutions, std::vector<std::string>{"0"});
  EXPECT_EQ(t.lines[1].substitutions, std::vector<std::string>{"true"});
}

TEST(VirtualMachine, StopInstructionEndsEarly) {
  Harness t("title: Start\n---\nOne.\n<<stop>>\nNever.\n===\n");
  t.machine->setNode("Start");
  t.runToPause();
  EXPECT_EQ(t.lines.size(), 1u);
  EXPECT_EQ(t.machine->executionState(), ExecutionState::Stopped);
  EXPECT_EQ(t.machine->currentNodeName(), "");
}

TEST(VirtualMachine, StateErrors) {
  auto storage = std::make_shared<rt::MemoryVariableStorage>();
  vm::VirtualMachine bare(std::make_shared<rt::Library>(rt::Library::standardLibrary()), storage);
  EXPECT_THROW(bare.setNode("Start"), exceptions::DialogueStateError);
  EXPECT_THROW(bare.continueDialogue(), exceptions::DialogueStateError);

  Harness t("title: Start\n---\nHi.\n===\n");
  EXPECT_THROW(t.machine->setNode("Nowhere"), exceptions::UnknownNodeError);
  EXPECT_THROW(t.machine->continueDialogue(), exceptions::DialogueStateError);
  EXPECT_THROW(t.machine->setSelectedOption(0), exceptions::InvalidOptionError);
}

TEST(VirtualMachine, FailingInstructionResetsAndRethrows) {
  auto storage = std::make_shared<rt::MemoryVariableStorage>();
  vm::VirtualMachine machine(std::make_shared<rt::Library>(rt::Library::standardLibrary()), storage);
  machine.setProgram(singleNodeProgram("Broken", {ir::Instruction(ir::Opcode::CallFunc, {std::string("missing"), 0.0})}));
  machine.setNode("Broken");
  EXPECT_THROW(machine.continueDialogue(), exceptions::UnknownFunctionError);
  EXPECT_EQ(machine.executionState(), ExecutionState::Stopped);
}

TEST(VirtualMachine, NestedContinueFromHandlerIsIgnored) {
  Harness t("title: Start\n---\nOne.\nTwo.\n===\n");
  t.machine->handlers().line = [&t](const vm::Line& l) {
    t.lines.push_back(l);
    t.machine->continueDialogue();
  };
  t.machine->setNode("Start");
  t.machine->continueDialogue();
  EXPECT_EQ(t.lines.size(), 1u);
  EXPECT_EQ(t.machine->executionState(), ExecutionState::WaitingForContinue);
}

TEST(VirtualMachine, StopFromHandlerEndsDialogue) {
  Harness t("title: Start\n---\nOne.\nTwo.\n===\n");
  t.machine->handlers().line = [&t](const vm::Line& l) {
    t.lines.push_back(l);
    t.machine->stop();
  };
  t.machine->setNode("Start");
  t.machine->continueDialogue();
  EXPECT_EQ(t.lines.size(), 1u);
  EXPECT_EQ(t.machine->executionState(), ExecutionState::Stopped);
  EXPECT_EQ(t.events.back(), "done");
}

TEST(VirtualMachine, PrepareForLinesAndMetrics) {
  Harness t("title: Start\n---\nA.\n-> B\n===\n");
  std::vector<std::string> prepared;
  t.machine->handlers().prepareForLines = [&prepared](const std::vector<std::string>& ids) { prepared = ids; };
  obs::Metrics metrics;
  t.machine->setMetrics(&metrics);
  t.machine->setNode("Start");
  EXPECT_EQ(prepared, (std::vector<std::string>{"line:<input>-Start-0", "line:<input>-Start-1"}));
  t.runToPause();
  EXPECT_GT(metrics.counter("vm.instructions"), 2u);
}

TEST(ExpandSubstitutions, ReplacesMarkersInOrder) {
  EXPECT_EQ(vm::expandSubstitutions("{0} and {1}, {0}!", {"A", "B"}), "A and B, A!");
  EXPECT_EQ(vm::expandSubstitutions("keep {2} and {x}", {"A"}), "keep {2} and {x}");
  EXPECT_EQ(vm::expandSubstitutions("plain", {}), "plain");
}
