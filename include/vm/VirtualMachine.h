/***
 * Name: spindle::vm::VirtualMachine
 * Purpose: Execute one compiled Program, pausing whenever content is delivered.
 * Inputs:
 *   - Program (shared, read-only), Library, VariableStorage
 *   - setNode / continueDialogue / setSelectedOption / stop calls
 * Outputs:
 *   - Handler invocations (lines, options, commands, node and dialogue events)
 *   - Variable writes through VariableStorage
 * Theory of Operation:
 *   A stack machine. continueDialogue() runs instructions of the current node
 *   until a line, option set or command is delivered, or the dialogue ends.
 *   A jump to another node completes the current one and keeps running.
 *   Labels are resolved through the node's label table. Option selection
 *   pushes the chosen option's label, which the instruction following
 *   ShowOptions pops and jumps to.
 *
 *   State machine:
 *     Stopped -> setNode -> WaitingForContinue -> continueDialogue -> Running
 *     Running -> line/command -> WaitingForContinue
 *     Running -> options -> WaitingOnOptionSelection -> select -> WaitingForContinue
 *     Running -> node end, Stop or stop() -> Stopped
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "ir/Program.h"
#include "runtime/Library.h"
#include "runtime/Value.h"
#include "runtime/VariableStorage.h"
#include "vm/Events.h"

namespace spindle { namespace obs { class Metrics; } }

namespace spindle::vm {

enum class ExecutionState { Stopped, WaitingOnOptionSelection, WaitingForContinue, Running };

const char* to_string(ExecutionState state);

class VirtualMachine {
 public:
  VirtualMachine(std::shared_ptr<const rt::Library> library, std::shared_ptr<rt::VariableStorage> storage);

  void setProgram(std::shared_ptr<const ir::Program> program);
  const std::shared_ptr<const ir::Program>& program() const { return program_; }

  Handlers& handlers() { return handlers_; }
  const Handlers& handlers() const { return handlers_; }

  // Counts executed instructions under `vm.instructions` when set.
  void setMetrics(obs::Metrics* metrics) { metrics_ = metrics; }

  void setNode(const std::string& name);
  void continueDialogue();
  void setSelectedOption(OptionId id);
  void stop();

  // Drops the current node, stack and pending options.
  void resetState();

  ExecutionState executionState() const { return state_; }
  const std::string& currentNodeName() const;

 private:
  void enterNode(const std::string& name);
  void completeNode();
  void finishDialogue();
  void runInstruction(const ir::Instruction& instruction);
  void jumpToLabel(const std::string& label);

  rt::Value pop();
  const rt::Value& peek() const;
  std::vector<std::string> popSubstitutions(std::size_t count);
  rt::Value readVariable(const std::string& name);

  std::shared_ptr<const rt::Library> library_;
  std::shared_ptr<rt::VariableStorage> storage_;
  std::shared_ptr<const ir::Program> program_{};
  Handlers handlers_{};
  obs::Metrics* metrics_{nullptr};

  ExecutionState state_{ExecutionState::Stopped};
  const ir::Node* node_{nullptr};
  std::size_t pc_{0};
  std::vector<rt::Value> stack_{};
  std::vector<DialogueOption> pendingOptions_{};
  std::vector<DialogueOption> presentedOptions_{};
};

} // namespace spindle::vm
